#pragma once

/**
 * @file ICommand.hpp
 * @brief Интерфейс команды по паттерну Command
 */

/**
 * @brief Интерфейс команды по паттерну Command
 *
 * Инкапсулирует единицу фоновой работы (например, очистку просроченных
 * записей), которую PeriodicTask выполняет по расписанию.
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * @brief Выполнить команду
     * @throws std::runtime_error если команду невозможно выполнить
     */
    virtual void execute() = 0;
};
