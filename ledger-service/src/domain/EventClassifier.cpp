#include "domain/EventClassifier.hpp"
#include "domain/errors/LedgerErrors.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>

namespace ledger::domain {

namespace {

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::vector<std::string> tokenize(const std::string& s) {
    std::vector<std::string> tokens;
    std::istringstream stream(s);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool isDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isdigit(c); });
}

bool ruleMatches(const EventClassifier::Rule& rule,
                 const std::string& upper,
                 const std::vector<std::string>& tokens) {
    switch (rule.match) {
        case EventClassifier::Match::Contains:
            return upper.find(rule.keyword) != std::string::npos;
        case EventClassifier::Match::Prefix:
            return startsWith(upper, rule.keyword);
        case EventClassifier::Match::Word:
            return std::any_of(tokens.begin(), tokens.end(), [&rule](const std::string& t) {
                return t == rule.keyword || startsWith(t, rule.keyword + "-");
            });
    }
    return false;
}

std::optional<int64_t> tryParseQuantity(const std::string& raw) {
    std::string text;
    for (char c : trim(raw)) {
        if (c != ',') text += c;
    }
    if (text.empty() || text == "-") {
        return 0;
    }

    bool negative = false;
    size_t pos = 0;
    if (text[0] == '-' || text[0] == '+') {
        negative = text[0] == '-';
        pos = 1;
    }

    std::string whole = text.substr(pos);
    std::string fraction;
    auto point = whole.find('.');
    if (point != std::string::npos) {
        fraction = whole.substr(point + 1);
        whole = whole.substr(0, point);
    }

    if (!isDigits(whole) || whole.size() > 15) {
        return std::nullopt;
    }
    if (!fraction.empty()) {
        // Выгрузки пишут "10.0"; реальные дробные доли бумаг не поддерживаются
        if (!isDigits(fraction) || fraction.find_first_not_of('0') != std::string::npos) {
            return std::nullopt;
        }
    }

    int64_t value = std::stoll(whole);
    return negative ? -value : value;
}

} // namespace

EventClassifier::EventClassifier(const ColumnMap& columns)
    : columns_(columns)
{}

const std::vector<EventClassifier::Rule>& EventClassifier::rules() {
    static const std::vector<Rule> ordered = {
        {"INITIAL PUBLIC OFFERING", Match::Contains, Category::Ipo},
        {"IPO",                     Match::Word,     Category::Ipo},
        {"CA-BONUS",                Match::Prefix,   Category::Bonus},
        {"BONUS",                   Match::Word,     Category::Bonus},
        {"CA-RIGHTS",               Match::Prefix,   Category::Rights},
        {"RIGHTS",                  Match::Word,     Category::Rights},
        {"CA-MERGER",               Match::Prefix,   Category::Merger},
        {"MERGER",                  Match::Word,     Category::Merger},
        {"CA-REARRANGEMENT",        Match::Prefix,   Category::Rearrangement},
        {"REARRANGEMENT",           Match::Word,     Category::Rearrangement},
        {"DEM",                     Match::Prefix,   Category::Demat},
        {"ON-CR",                   Match::Prefix,   Category::RegularCredit},
        {"ON-DR",                   Match::Prefix,   Category::RegularDebit},
        {"BUY",                     Match::Word,     Category::RegularCredit},
        {"SELL",                    Match::Word,     Category::RegularDebit}
    };
    return ordered;
}

std::optional<EventClassifier::Category> EventClassifier::categorize(const std::string& description) {
    std::string upper = toUpper(trim(description));
    auto tokens = tokenize(upper);

    for (const auto& rule : rules()) {
        if (ruleMatches(rule, upper, tokens)) {
            return rule.category;
        }
    }
    return std::nullopt;
}

EventMemo EventClassifier::parseMemo(const std::string& description) {
    EventMemo memo;
    auto tokens = tokenize(description);

    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& token = tokens[i];
        std::string upper = toUpper(token);

        if (startsWith(upper, "TD:")) {
            memo.tradeId = token.substr(3);
        } else if (startsWith(upper, "TX:")) {
            memo.transactionId = token.substr(3);
        } else if (startsWith(upper, "SET:")) {
            memo.settlementCode = token.substr(4);
        } else if (startsWith(upper, "B-") && token.find('%') != std::string::npos) {
            memo.bonusRate = token;
        } else if (startsWith(upper, "R-") && token.find('%') != std::string::npos) {
            memo.rightsRate = token;
        } else if (upper == "PUR" && i + 1 < tokens.size()) {
            memo.purchaseDate = Date::parse(tokens[i + 1]);
        } else if (memo.referenceId.empty() && token.size() == 8 && isDigits(token)) {
            memo.referenceId = token;
        }
    }

    return memo;
}

int64_t EventClassifier::parseQuantity(const std::string& field) {
    auto value = tryParseQuantity(field);
    if (!value) {
        throw RowParseError(RowErrorCode::MalformedQuantity, "'" + field + "'");
    }
    return *value;
}

std::string EventClassifier::field(const std::vector<std::string>& record,
                                   const std::optional<size_t>& index) const {
    if (!index || *index >= record.size()) {
        return "";
    }
    return trim(record[*index]);
}

ClassifiedRow EventClassifier::classify(const std::vector<std::string>& record, int rowNumber) const {
    if (record.size() < columns_.requiredWidth()) {
        throw RowParseError(RowErrorCode::ShortRow,
            "expected at least " + std::to_string(columns_.requiredWidth()) +
            " fields, got " + std::to_string(record.size()));
    }

    ClassifiedRow result;
    LedgerEvent& event = result.event;

    event.symbol = toUpper(field(record, columns_.symbol));
    if (event.symbol.empty()) {
        throw RowParseError(RowErrorCode::MissingSymbol, "empty symbol");
    }

    std::string dateText = field(record, columns_.date);
    auto date = Date::parse(dateText);
    if (!date) {
        throw RowParseError(RowErrorCode::MalformedDate, "'" + dateText + "'");
    }
    event.date = *date;

    // ========================================================================
    // Количество и направление
    // ========================================================================

    int64_t credit = 0;
    int64_t debit = 0;
    if (columns_.hasSplitQuantity()) {
        credit = parseQuantity(field(record, columns_.credit));
        debit = parseQuantity(field(record, columns_.debit));
        if (credit < 0 || debit < 0) {
            throw RowParseError(RowErrorCode::MalformedQuantity, "negative credit/debit quantity");
        }
    } else {
        int64_t signedQuantity = parseQuantity(field(record, columns_.quantity));
        credit = signedQuantity > 0 ? signedQuantity : 0;
        debit = signedQuantity < 0 ? -signedQuantity : 0;
    }

    if ((credit > 0) == (debit > 0)) {
        throw RowParseError(RowErrorCode::AmbiguousQuantity,
            "credit=" + std::to_string(credit) + " debit=" + std::to_string(debit));
    }
    bool isCredit = credit > 0;
    event.quantity = isCredit ? credit : debit;

    // ========================================================================
    // Тип события
    // ========================================================================

    event.description = field(record, columns_.description);
    auto category = categorize(event.description);
    if (!category) {
        result.unclassified = true;
        category = Category::Regular;
    }

    auto requireCredit = [&](EventKind kind) {
        if (!isCredit) {
            throw RowParseError(RowErrorCode::DirectionMismatch,
                toString(kind) + " row must be a credit: '" + event.description + "'");
        }
        return kind;
    };
    auto requireDebit = [&](EventKind kind) {
        if (isCredit) {
            throw RowParseError(RowErrorCode::DirectionMismatch,
                toString(kind) + " row must be a debit: '" + event.description + "'");
        }
        return kind;
    };

    switch (*category) {
        case Category::Ipo:           event.kind = requireCredit(EventKind::IPO); break;
        case Category::Bonus:         event.kind = requireCredit(EventKind::BONUS); break;
        case Category::Rights:        event.kind = requireCredit(EventKind::RIGHTS); break;
        case Category::Rearrangement: event.kind = requireCredit(EventKind::REARRANGEMENT); break;
        case Category::Merger:
            event.kind = isCredit ? EventKind::MERGER_IN : EventKind::MERGER_OUT;
            break;
        case Category::Demat:
            // Зачисление при дематериализации - это покупка, цену дозаполнят
            event.kind = isCredit ? EventKind::BUY : EventKind::DEMAT;
            break;
        case Category::RegularCredit: event.kind = requireCredit(EventKind::BUY); break;
        case Category::RegularDebit:  event.kind = requireDebit(EventKind::SELL); break;
        case Category::Regular:
            event.kind = isCredit ? EventKind::BUY : EventKind::SELL;
            break;
    }

    if (result.unclassified) {
        std::cerr << "[EventClassifier] Unclassified description '" << event.description
                  << "' at row " << rowNumber << " (" << event.symbol
                  << "), treated as " << toString(event.kind) << std::endl;
    }

    // ========================================================================
    // Цена, комиссии, остаток
    // ========================================================================

    std::string priceText = field(record, columns_.price);
    if (carriesCashFlow(event.kind) && !priceText.empty() && priceText != "-") {
        Money price;
        try {
            price = Money::fromString(priceText);
        } catch (const MoneyFormatError&) {
            throw RowParseError(RowErrorCode::MalformedPrice, "'" + priceText + "'");
        }
        if (price.isNegative()) {
            throw RowParseError(RowErrorCode::MalformedPrice, "negative price '" + priceText + "'");
        }
        // Ноль в колонке цены означает "цену ещё не ввели"
        if (price.isPositive()) {
            event.unitPrice = price;
        }
    }

    std::string feesText = field(record, columns_.fees);
    if (isDisposal(event.kind) && !feesText.empty() && feesText != "-") {
        Money fees;
        try {
            fees = Money::fromString(feesText);
        } catch (const MoneyFormatError&) {
            throw RowParseError(RowErrorCode::MalformedPrice, "fees '" + feesText + "'");
        }
        if (fees.isNegative()) {
            throw RowParseError(RowErrorCode::MalformedPrice, "negative fees '" + feesText + "'");
        }
        if (fees.isPositive()) {
            event.fees = fees;
        }
    }

    std::string balanceText = field(record, columns_.balanceAfter);
    if (!balanceText.empty() && balanceText != "-") {
        auto balance = tryParseQuantity(balanceText);
        if (balance && *balance >= 0) {
            event.balanceAfter = balance;
        }
    }

    event.memo = parseMemo(event.description);
    return result;
}

} // namespace ledger::domain
