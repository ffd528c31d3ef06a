#include "veritas/shape.hpp"

#include <array>
#include <stdexcept>
#include <utility>

namespace veritas {

namespace {

auto email_field(const value& v) noexcept -> bool {
    return is_string(v) && is_valid_email(v.get_ref<const std::string&>());
}

auto phone_field(const value& v) noexcept -> bool {
    return is_string(v) && is_valid_phone_number(v.get_ref<const std::string&>());
}

auto address_errors(const value& v) -> std::vector<field_error> {
    return shape_errors(address_shape(), v);
}

auto contact_errors(const value& v) -> std::vector<field_error> {
    return shape_errors(contact_info_shape(), v);
}

constexpr field_rule kAddressShape[] = {
    {"street", true, &is_non_empty_string, "street must be a non-empty string", nullptr},
    {"city", true, &is_non_empty_string, "city must be a non-empty string", nullptr},
    {"state", true, &is_non_empty_string, "state must be a non-empty string", nullptr},
    {"zipCode", true, &is_non_empty_string, "zipCode must be a non-empty string", nullptr},
    {"country", true, &is_non_empty_string, "country must be a non-empty string", nullptr},
};

constexpr field_rule kContactInfoShape[] = {
    {"email", true, &email_field, "email must be a valid email address", nullptr},
    {"phone", false, &phone_field, "phone must contain at least 10 digits", nullptr},
    {"address", false, &is_address, "address must be a valid address record", &address_errors},
};

constexpr field_rule kUserShape[] = {
    {"id", true, &is_non_empty_string, "id must be a non-empty string", nullptr},
    {"name", true, &is_non_empty_string, "name must be a non-empty string", nullptr},
    {"contact", true, &is_contact_info, "contact must be a valid contact record", &contact_errors},
    {"age", true, &is_positive_integer, "Age must be a positive integer", nullptr},
    {"isActive", true, &is_boolean, "isActive must be a boolean", nullptr},
    {"tags", true, &is_tag_list, "tags must be an array of non-empty strings", nullptr},
    {"metadata", false, &is_plain_object, "metadata must be a plain object", nullptr},
    {"createdAt", true, &is_date, "createdAt must be a valid date", nullptr},
    {"updatedAt", true, &is_date, "updatedAt must be a valid date", nullptr},
};

auto admin_role(const value& v) noexcept -> bool {
    return is_string(v) && v.get_ref<const std::string&>() == "admin";
}

auto regular_role(const value& v) noexcept -> bool {
    return is_string(v) && v.get_ref<const std::string&>() == "user";
}

auto string_list(const value& v) noexcept -> bool { return is_array_of(v, &is_string); }

auto subscription_field(const value& v) noexcept -> bool {
    return is_string(v) && subscription_from_string(v.get_ref<const std::string&>()).has_value();
}

template <std::size_t N, std::size_t M>
constexpr auto extend_shape(const field_rule (&base)[N], const field_rule (&extra)[M])
    -> std::array<field_rule, N + M> {
    std::array<field_rule, N + M> out{};
    for (std::size_t i = 0; i < N; ++i) out[i] = base[i];
    for (std::size_t i = 0; i < M; ++i) out[N + i] = extra[i];
    return out;
}

constexpr field_rule kAdminRules[] = {
    {"role", true, &admin_role, "role must be \"admin\"", nullptr},
    {"permissions", true, &string_list, "permissions must be an array of strings", nullptr},
    {"lastLogin", false, &is_date, "lastLogin must be a valid date", nullptr},
};

constexpr field_rule kRegularRules[] = {
    {"role", true, &regular_role, "role must be \"user\"", nullptr},
    {"subscription", false, &subscription_field, "subscription must be one of basic, premium, enterprise", nullptr},
};

constexpr auto kAdminUserShape = extend_shape(kUserShape, kAdminRules);
constexpr auto kRegularUserShape = extend_shape(kUserShape, kRegularRules);

auto text(const value& v, const char* key) -> std::string {
    return v.at(key).get<std::string>();
}

auto instant(const value& v, const char* key) -> core::timestamp {
    // Only reached after is_date accepted the field.
    return *core::parse_timestamp(v.at(key).get_ref<const std::string&>());
}

auto narrow_address(const value& v) -> Address {
    return Address{text(v, "street"), text(v, "city"), text(v, "state"),
                   text(v, "zipCode"), text(v, "country")};
}

auto narrow_contact(const value& v) -> ContactInfo {
    ContactInfo c;
    c.email = text(v, "email");
    if (v.contains("phone")) c.phone = text(v, "phone");
    if (v.contains("address")) c.address = narrow_address(v.at("address"));
    return c;
}

auto narrow_user(const value& v) -> User {
    User u;
    u.id = text(v, "id");
    u.name = text(v, "name");
    u.contact = narrow_contact(v.at("contact"));
    u.age = integer_value(v.at("age"));
    u.is_active = v.at("isActive").get<bool>();
    u.tags = v.at("tags").get<std::vector<std::string>>();
    if (v.contains("metadata")) u.metadata = v.at("metadata");
    u.created_at = instant(v, "createdAt");
    u.updated_at = instant(v, "updatedAt");
    return u;
}

auto narrow_admin(const value& v) -> AdminUser {
    AdminUser a;
    a.user = narrow_user(v);
    a.permissions = v.at("permissions").get<std::vector<std::string>>();
    if (v.contains("lastLogin")) a.last_login = instant(v, "lastLogin");
    return a;
}

auto narrow_regular(const value& v) -> RegularUser {
    RegularUser r;
    r.user = narrow_user(v);
    if (v.contains("subscription")) {
        r.subscription = subscription_from_string(v.at("subscription").get_ref<const std::string&>());
    }
    return r;
}

} // namespace

auto matches_shape(std::span<const field_rule> shape, const value& v) noexcept -> bool {
    if (!v.is_object()) return false;
    for (const auto& rule : shape) {
        auto it = v.find(std::string(rule.name));
        if (it == v.end()) {
            if (rule.required) return false;
            continue;
        }
        if (!rule.check(*it)) return false;
    }
    return true;
}

auto shape_errors(std::span<const field_rule> shape, const value& v) -> std::vector<field_error> {
    std::vector<field_error> errors;
    if (!v.is_object()) {
        errors.push_back(field_error{"root", "Value is not an object", v});
        return errors;
    }
    for (const auto& rule : shape) {
        const std::string name(rule.name);
        auto it = v.find(name);
        if (it == v.end()) {
            if (rule.required) {
                errors.push_back(field_error{name, "Missing or invalid " + name + " field", nullptr});
            }
            continue;
        }
        if (rule.check(*it)) continue;
        value received = *it;
        if (rule.nested != nullptr) {
            value detail = value::object();
            detail["received"] = *it;
            detail["errors"] = to_json(rule.nested(*it));
            received = std::move(detail);
        }
        errors.push_back(field_error{name, std::string(rule.expectation), std::move(received)});
    }
    return errors;
}

auto address_shape() noexcept -> std::span<const field_rule> { return kAddressShape; }
auto contact_info_shape() noexcept -> std::span<const field_rule> { return kContactInfoShape; }
auto user_shape() noexcept -> std::span<const field_rule> { return kUserShape; }
auto admin_user_shape() noexcept -> std::span<const field_rule> { return kAdminUserShape; }
auto regular_user_shape() noexcept -> std::span<const field_rule> { return kRegularUserShape; }

auto to_string(Subscription s) -> std::string_view {
    switch (s) {
        case Subscription::basic: return "basic";
        case Subscription::premium: return "premium";
        case Subscription::enterprise: return "enterprise";
    }
    throw std::logic_error("unhandled subscription");
}

auto subscription_from_string(std::string_view s) noexcept -> std::optional<Subscription> {
    if (s == "basic") return Subscription::basic;
    if (s == "premium") return Subscription::premium;
    if (s == "enterprise") return Subscription::enterprise;
    return std::nullopt;
}

auto is_address(const value& v) noexcept -> bool { return matches_shape(kAddressShape, v); }
auto is_contact_info(const value& v) noexcept -> bool { return matches_shape(kContactInfoShape, v); }
auto is_user(const value& v) noexcept -> bool { return matches_shape(kUserShape, v); }
auto is_admin_user(const value& v) noexcept -> bool { return matches_shape(kAdminUserShape, v); }
auto is_regular_user(const value& v) noexcept -> bool { return matches_shape(kRegularUserShape, v); }

auto is_tag_list(const value& v) noexcept -> bool { return is_array_of(v, &is_non_empty_string); }

auto validate_address(const value& v) -> validation_result<Address> {
    auto errors = shape_errors(kAddressShape, v);
    if (!errors.empty()) return std::unexpected(std::move(errors));
    return narrow_address(v);
}

auto validate_contact_info(const value& v) -> validation_result<ContactInfo> {
    auto errors = shape_errors(kContactInfoShape, v);
    if (!errors.empty()) return std::unexpected(std::move(errors));
    return narrow_contact(v);
}

auto validate_user(const value& v) -> validation_result<User> {
    auto errors = shape_errors(kUserShape, v);
    if (!errors.empty()) return std::unexpected(std::move(errors));
    return narrow_user(v);
}

auto validate_admin_user(const value& v) -> validation_result<AdminUser> {
    auto errors = shape_errors(kAdminUserShape, v);
    if (!errors.empty()) return std::unexpected(std::move(errors));
    return narrow_admin(v);
}

auto validate_regular_user(const value& v) -> validation_result<RegularUser> {
    auto errors = shape_errors(kRegularUserShape, v);
    if (!errors.empty()) return std::unexpected(std::move(errors));
    return narrow_regular(v);
}

auto to_json(const Address& a) -> value {
    value j = value::object();
    j["street"] = a.street;
    j["city"] = a.city;
    j["state"] = a.state;
    j["zipCode"] = a.zip_code;
    j["country"] = a.country;
    return j;
}

auto to_json(const ContactInfo& c) -> value {
    value j = value::object();
    j["email"] = c.email;
    if (c.phone) j["phone"] = *c.phone;
    if (c.address) j["address"] = to_json(*c.address);
    return j;
}

auto to_json(const User& u) -> value {
    value j = value::object();
    j["id"] = u.id;
    j["name"] = u.name;
    j["contact"] = to_json(u.contact);
    j["age"] = u.age;
    j["isActive"] = u.is_active;
    j["tags"] = u.tags;
    if (u.metadata) j["metadata"] = *u.metadata;
    j["createdAt"] = core::format_timestamp(u.created_at);
    j["updatedAt"] = core::format_timestamp(u.updated_at);
    return j;
}

auto to_json(const AdminUser& u) -> value {
    value j = to_json(u.user);
    j["role"] = "admin";
    j["permissions"] = u.permissions;
    if (u.last_login) j["lastLogin"] = core::format_timestamp(*u.last_login);
    return j;
}

auto to_json(const RegularUser& u) -> value {
    value j = to_json(u.user);
    j["role"] = "user";
    if (u.subscription) j["subscription"] = std::string(to_string(*u.subscription));
    return j;
}

auto to_json(const field_error& e) -> value {
    value j = value::object();
    j["field"] = e.field;
    j["message"] = e.message;
    j["value"] = e.received;
    return j;
}

auto to_json(const std::vector<field_error>& errors) -> value {
    value arr = value::array();
    for (const auto& e : errors) arr.push_back(to_json(e));
    return arr;
}

} // namespace veritas
