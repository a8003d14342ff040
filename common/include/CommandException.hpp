#pragma once

#include <stdexcept>
#include <string>

/**
 * @file CommandException.hpp
 * @brief Ошибка разбора или выполнения команды
 *
 * Означает ошибку вызова (неизвестная команда, нет обязательного
 * аргумента), а не ошибку данных.
 */
class CommandException : public std::runtime_error {
public:
    explicit CommandException(const std::string& message)
        : std::runtime_error(message) {}
};
