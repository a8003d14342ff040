#pragma once

#include <string>

/**
 * @file ICommand.hpp
 * @brief Интерфейс команды по паттерну Command
 */

/**
 * @brief Одна операция, собранная вместе со своими аргументами
 *
 * Аргументы передаются в конструктор, поэтому команды можно собрать
 * заранее списком и выполнить по очереди.
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /// Имя для логов
    virtual std::string name() const = 0;

    /**
     * @brief Выполнить команду
     * @throws CommandException если аргументы команды неверны
     */
    virtual void execute() = 0;
};
