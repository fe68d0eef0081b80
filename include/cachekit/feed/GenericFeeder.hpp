#pragma once

#include <cachekit/feed/ICacheFeed.hpp>

#include <utility>

/**
 * @brief Простейший приёмник: id на входе, std::optional<T> на выходе
 *
 * @code
 *   GenericFeeder<User> feeder("42");
 *   service.execute(feeder, provider);
 *   if (feeder.data) { ... }
 * @endcode
 */
template<typename T>
class GenericFeeder : public ICacheFeed<T> {
public:
    using Key = typename ICacheFeed<T>::Key;

    explicit GenericFeeder(Key id)
        : id(std::move(id))
    {}

    Key entityId() override {
        return id;
    }

    void feed(std::optional<T> entity) override {
        data = std::move(entity);
    }

    Key id;
    std::optional<T> data;
};
