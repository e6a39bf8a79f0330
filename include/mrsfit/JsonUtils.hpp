#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace mrsfit {

/*  parse a JSON file; PreconditionError if it cannot be opened or parsed    */
nlohmann::json load_json(const std::string& path);

/*  replace ${VAR} in every string value by the environment variable         */
void expand_env(nlohmann::json& j);

/*  j[key] if present, otherwise `fallback`                                   */
template<typename T>
T value_or(const nlohmann::json& j, const char* key, const T& fallback)
{
    const auto it = j.find(key);
    return it == j.end() ? fallback : it->template get<T>();
}

} // namespace mrsfit
