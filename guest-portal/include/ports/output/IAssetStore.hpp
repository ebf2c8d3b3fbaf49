#pragma once

#include <optional>
#include <string>

namespace portal::ports::output {

/**
 * @brief Доступ к собранному фронтенду (index.html, success.html, статика)
 */
class IAssetStore {
public:
    virtual ~IAssetStore() = default;

    /**
     * @brief Прочитать файл по относительному пути ("index.html", "assets/app.js")
     * @return nullopt если файла нет или путь выходит за пределы каталога
     */
    virtual std::optional<std::string> read(const std::string& relativePath) = 0;
};

} // namespace portal::ports::output
