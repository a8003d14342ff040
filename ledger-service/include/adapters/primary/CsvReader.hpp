#pragma once

#include <fstream>
#include <ios>
#include <istream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace ledger::adapters::primary {

/**
 * @brief Чтение CSV-выгрузок в таблицу строк
 *
 * Поля в кавычках могут содержать запятые и переводы строк,
 * "" внутри кавычек - это одна кавычка. CRLF и LF равноправны.
 * Пустые строки пропускаются. BOM в начале файла отбрасывается.
 */
class CsvReader {
public:
    using Table = std::vector<std::vector<std::string>>;

    static Table parse(std::istream& in) {
        const std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};

        Table table;
        std::vector<std::string> record;
        std::string field;
        bool inQuotes = false;
        bool fieldStarted = false;

        // BOM снимается только целиком, все три байта
        size_t i = text.compare(0, 3, "\xEF\xBB\xBF") == 0 ? 3 : 0;
        auto next = [&]() { return i + 1 < text.size() ? text[i + 1] : '\0'; };

        for (; i < text.size(); ++i) {
            const char c = text[i];

            if (inQuotes) {
                if (c == '"') {
                    if (next() == '"') {
                        ++i;
                        field += '"';
                    } else {
                        inQuotes = false;
                    }
                } else {
                    field += c;
                }
                continue;
            }

            switch (c) {
                case '"':
                    inQuotes = true;
                    fieldStarted = true;
                    break;
                case ',':
                    record.push_back(field);
                    field.clear();
                    fieldStarted = true;
                    break;
                case '\r':
                    if (next() == '\n') ++i;
                    finishRecord(table, record, field, fieldStarted);
                    break;
                case '\n':
                    finishRecord(table, record, field, fieldStarted);
                    break;
                default:
                    field += c;
                    fieldStarted = true;
            }
        }

        if (inQuotes) {
            throw std::runtime_error("CSV: unterminated quoted field");
        }
        finishRecord(table, record, field, fieldStarted);
        return table;
    }

    static Table readFile(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw std::ios_base::failure("Cannot open file: " + path);
        }
        return parse(in);
    }

private:
    static void finishRecord(Table& table, std::vector<std::string>& record,
                             std::string& field, bool& fieldStarted) {
        if (fieldStarted || !record.empty()) {
            record.push_back(field);
            table.push_back(record);
        }
        record.clear();
        field.clear();
        fieldStarted = false;
    }
};

} // namespace ledger::adapters::primary
