#pragma once

#include <cachekit/Types.hpp>

#include <string>

/**
 * @brief Наблюдатель событий движка кэша
 *
 * Все методы имеют пустую реализацию — наследник переопределяет только
 * нужные. Вызовы идут синхронно из потока, выполняющего операцию,
 * одновременно из многих потоков: реализация должна быть потокобезопасной
 * и быстрой.
 *
 * События:
 * - recordHit — операция вернула значение
 * - recordMiss — операция завершилась без значения
 * - recordSet — значение записано в хранилище
 * - recordDelete — ключ удалён из хранилища (Invalidate)
 * - recordError — попытка завершилась ошибкой
 *
 * @note elapsed для hit/miss/error считается от начала последней
 *       попытки, а не от начала всего вызова с повторами.
 */
class ICacheMetrics {
public:
    virtual ~ICacheMetrics() = default;

    virtual void recordHit(const std::string& key, Duration elapsed) { (void)key; (void)elapsed; }
    virtual void recordMiss(const std::string& key, Duration elapsed) { (void)key; (void)elapsed; }
    virtual void recordSet(const std::string& key, Duration elapsed) { (void)key; (void)elapsed; }
    virtual void recordDelete(const std::string& key, Duration elapsed) { (void)key; (void)elapsed; }
    virtual void recordError(const std::string& key, const std::string& error) {
        (void)key; (void)error;
    }
};
