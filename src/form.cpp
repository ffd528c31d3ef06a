#include "veritas/form.hpp"

#include <charconv>
#include <string>
#include <vector>

namespace veritas {

namespace {

constexpr std::int64_t kMinAge = 1;
constexpr std::int64_t kMaxAge = 120;

auto split_tags(std::string_view s) -> std::vector<std::string> {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= s.size()) {
        auto comma = s.find(',', start);
        if (comma == std::string_view::npos) comma = s.size();
        auto tag = trim(s.substr(start, comma - start));
        if (!tag.empty()) out.emplace_back(tag);
        start = comma + 1;
    }
    return out;
}

// Leading decimal integer, like parseInt(s, 10): "28" -> 28, "28yrs" -> 28, "x" -> none.
auto parse_leading_int(std::string_view s) -> std::optional<std::int64_t> {
    s = trim(s);
    if (!s.empty() && s.front() == '+') s.remove_prefix(1);
    std::int64_t out = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (ec != std::errc{} || ptr == s.data()) return std::nullopt;
    return out;
}

} // namespace

auto is_user_form_data(const value& v) noexcept -> bool {
    if (!v.is_object()) return false;
    auto has = [&](const char* key, predicate_fn pred) {
        auto it = v.find(key);
        return it != v.end() && pred(*it);
    };
    return has("name", &is_string) && has("email", &is_string) && has("age", &is_string) &&
           has("tags", &is_string) && has("isActive", &is_boolean);
}

auto validate_user_form(const value& v) -> validation_result<value> {
    if (!is_user_form_data(v)) {
        return std::unexpected(std::vector<field_error>{
            field_error{"name", "Invalid form data structure", v}});
    }

    std::vector<field_error> errors;
    const auto& name = v.at("name").get_ref<const std::string&>();
    const auto& email = v.at("email").get_ref<const std::string&>();
    const auto& age_text = v.at("age").get_ref<const std::string&>();
    const auto& tags_text = v.at("tags").get_ref<const std::string&>();

    if (trim(name).empty()) {
        errors.push_back(field_error{"name", "Name is required", v.at("name")});
    }
    if (!is_valid_email(email)) {
        errors.push_back(field_error{"email", "Invalid email format", v.at("email")});
    }
    auto age = parse_leading_int(age_text);
    if (!age || *age < kMinAge || *age > kMaxAge) {
        errors.push_back(field_error{"age", "Age must be between 1 and 120", v.at("age")});
    }
    auto tags = split_tags(tags_text);
    if (tags.empty()) {
        errors.push_back(field_error{"tags", "At least one tag is required", v.at("tags")});
    }
    if (!errors.empty()) return std::unexpected(std::move(errors));

    value input = value::object();
    input["name"] = std::string(trim(name));
    input["contact"] = value::object();
    input["contact"]["email"] = email;
    input["age"] = *age;
    input["isActive"] = v.at("isActive").get<bool>();
    input["tags"] = tags;
    return input;
}

} // namespace veritas
