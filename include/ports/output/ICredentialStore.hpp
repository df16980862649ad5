#pragma once

#include "domain/Credentials.hpp"
#include <optional>
#include <string>

namespace nimbasms::ports::output {

/**
 * @brief Хранилище учётных данных CLI
 */
class ICredentialStore {
public:
    virtual ~ICredentialStore() = default;

    /**
     * @brief Загрузить учётные данные
     *
     * Отсутствующее или повреждённое хранилище даёт пустые Credentials.
     */
    virtual domain::Credentials load() = 0;

    /**
     * @brief Сохранить; незаданное поле сохраняет прежнее значение
     * @throws std::runtime_error при ошибке записи
     */
    virtual void save(const std::optional<std::string>& serviceId,
                      const std::optional<std::string>& secretToken) = 0;
};

} // namespace nimbasms::ports::output
