#pragma once

#include <nlohmann/json.hpp>
#include "fmt/format.h"
#include <string>
#include <stdexcept>

namespace utils::json {
    // Value of key converted to T, or defaultValue when the key is absent.
    // A present key holding the wrong type is an error.
    template <class T>
    T getOr(const nlohmann::json& jsonObj, const std::string& key, const T& defaultValue) {
        auto jsonItem = jsonObj.find(key);
        if (jsonItem == jsonObj.end() || jsonItem->is_null()) {
            return defaultValue;
        }

        try {
            return jsonItem->get<T>();
        }
        catch (const nlohmann::json::exception& e) {
            throw std::invalid_argument(fmt::format("Invalid value of {}: {}", key, e.what()));
        }
    }
}
