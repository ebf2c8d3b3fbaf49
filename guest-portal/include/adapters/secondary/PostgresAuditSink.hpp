#pragma once

#include "ports/output/IAuditSink.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <atomic>
#include <memory>
#include <iostream>

namespace portal::adapters::secondary
{

    /**
     * @brief Журнал гостевых сессий в PostgreSQL
     *
     * Таблица user_sessions создаётся при старте или при первой записи, если её нет.
     * Соединение открывается на каждую запись: записи редкие (одна на гостя).
     */
    class PostgresAuditSink : public portal::ports::output::IAuditSink
    {
    public:
        explicit PostgresAuditSink(std::shared_ptr<portal::settings::DbSettings> s) : settings_(std::move(s))
        {
            // БД может подняться позже сервиса: ошибка здесь не мешает старту
            try
            {
                ensureSchema();
                std::cout << "[PostgresAuditSink] Connected to " << settings_->getName() << std::endl;
            }
            catch (const std::exception &e)
            {
                std::cerr << "[PostgresAuditSink] Database unavailable at startup: " << e.what() << std::endl;
            }
        }

        void record(const portal::domain::AuditRecord &r) override
        {
            if (!schemaReady_)
            {
                ensureSchema();
            }
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            t.exec_params(
                "INSERT INTO user_sessions (cache_id, id, ap, name, email, duration, created_at) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7)",
                r.token, r.deviceId, r.apId, r.displayName, r.email,
                r.durationMinutes, r.createdAt.toString());
            t.commit();
            std::cout << "[PostgresAuditSink] Saved session: " << r.token << std::endl;
        }

    private:
        std::shared_ptr<portal::settings::DbSettings> settings_;
        std::atomic<bool> schemaReady_{false};

        void ensureSchema()
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            t.exec(
                "CREATE TABLE IF NOT EXISTS user_sessions ("
                "  cache_id TEXT PRIMARY KEY,"
                "  id TEXT,"
                "  ap TEXT,"
                "  name TEXT,"
                "  email TEXT,"
                "  duration INTEGER,"
                "  created_at TEXT"
                ")");
            t.commit();
            schemaReady_ = true;
        }
    };

} // namespace portal::adapters::secondary
