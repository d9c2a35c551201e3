#pragma once

#include <string>
#include <cstdint>

namespace campaign::ports::output {

/**
 * @brief Хранилище чекпоинтов проекций
 *
 * Одна запись на проекцию: последний обработанный глобальный номер.
 */
class ICheckpointStore {
public:
    virtual ~ICheckpointStore() = default;

    virtual void initialize() = 0;

    /**
     * @return Сохранённый чекпоинт или 0, если проекция ещё ничего не обработала
     */
    virtual int64_t load(const std::string& projectionName) = 0;

    virtual void save(const std::string& projectionName, int64_t globalSequence) = 0;

    virtual void reset(const std::string& projectionName) = 0;
};

} // namespace campaign::ports::output
