#pragma once

#include "ports/output/IAssetStore.hpp"
#include "settings/PortalSettings.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>

namespace portal::adapters::secondary {

/**
 * @brief Чтение собранного фронтенда с диска
 *
 * Пути с сегментом ".." и абсолютные пути отклоняются, чтобы запрос
 * не мог выйти за пределы FRONTEND_DIR.
 */
class FileSystemAssetStore : public ports::output::IAssetStore {
public:
    explicit FileSystemAssetStore(std::shared_ptr<settings::PortalSettings> settings)
        : root_(settings->getFrontendDir())
    {
        std::error_code ec;
        if (!std::filesystem::is_directory(root_, ec)) {
            std::cerr << "[FileSystemAssetStore] Warning: frontend directory not found: "
                      << root_ << std::endl;
        }
        std::cout << "[FileSystemAssetStore] Serving from " << root_ << std::endl;
    }

    std::optional<std::string> read(const std::string& relativePath) override {
        std::filesystem::path rel(relativePath);
        if (rel.empty() || rel.is_absolute() || rel.has_root_name()) {
            return std::nullopt;
        }
        for (const auto& part : rel) {
            if (part == "..") {
                return std::nullopt;
            }
        }

        std::filesystem::path full = root_ / rel;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(full, ec)) {
            return std::nullopt;
        }

        std::ifstream in(full, std::ios::binary);
        if (!in) {
            std::cerr << "[FileSystemAssetStore] Cannot open " << full << std::endl;
            return std::nullopt;
        }
        std::ostringstream content;
        content << in.rdbuf();
        return content.str();
    }

private:
    std::filesystem::path root_;
};

} // namespace portal::adapters::secondary
