#include "regauth/security/scopes.hpp"

#include <charconv>
#include <cstddef>
#include <cstring>

namespace regauth::security {
    using regauth::core::CratePattern;
    using regauth::core::CrateScopeList;
    using regauth::core::EndpointScope;
    using regauth::core::EndpointScopeList;
    using regauth::core::kMaxCrateNameLen;
    using regauth::core::kMaxCrateScopes;
    using regauth::core::kMaxEndpointScopes;

    namespace {
        [[nodiscard]] regauth::core::Status invalid() noexcept {
            return regauth::core::make_status(regauth::core::StatusDomain::Security, regauth::core::StatusCode::Invalid);
        }

        [[nodiscard]] regauth::core::Status corrupt(u32 aux = 0) noexcept {
            return regauth::core::make_status(regauth::core::StatusDomain::Security, regauth::core::StatusCode::Corrupt, aux);
        }

        [[nodiscard]] bool is_alpha(char c) noexcept {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        }

        [[nodiscard]] bool is_name_char(char c) noexcept {
            return is_alpha(c) || (c >= '0' && c <= '9') || c == '-' || c == '_';
        }

        // Registry normalization: case-insensitive, '-' and '_' equivalent.
        [[nodiscard]] char normalize(char c) noexcept {
            if (c >= 'A' && c <= 'Z') {
                return static_cast<char>(c - 'A' + 'a');
            }
            if (c == '-') {
                return '_';
            }
            return c;
        }

        [[nodiscard]] bool name_chars_valid(const char* s, size_t len) noexcept {
            if (len == 0 || len > kMaxCrateNameLen) {
                return false;
            }
            if (!is_alpha(s[0])) {
                return false;
            }
            for (size_t i = 1; i < len; ++i) {
                if (!is_name_char(s[i])) {
                    return false;
                }
            }
            return true;
        }

        [[nodiscard]] size_t bounded_len(const char* s, size_t limit) noexcept {
            size_t n = 0;
            while (n <= limit && s[n] != '\0') {
                ++n;
            }
            return n;
        }

        [[nodiscard]] bool append(char* out, u32 cap, u32* pos, const char* s, size_t len) noexcept {
            if (*pos + len + 1 > cap) {
                return false;
            }
            std::memcpy(out + *pos, s, len);
            *pos += static_cast<u32>(len);
            out[*pos] = '\0';
            return true;
        }
    } // namespace

    u8 endpoint_scope_encode(EndpointScope scope) noexcept {
        return static_cast<u8>(scope);
    }

    regauth::core::Status endpoint_scope_decode(i64 raw, EndpointScope* out) noexcept {
        if (out == nullptr) {
            return invalid();
        }
        switch (raw) {
            case 1: *out = EndpointScope::Publish; return regauth::core::ok_status();
            case 2: *out = EndpointScope::Yank; return regauth::core::ok_status();
            case 3: *out = EndpointScope::ChangeOwners; return regauth::core::ok_status();
            default: return corrupt(static_cast<u32>(raw));
        }
    }

    const char* endpoint_scope_str(EndpointScope scope) noexcept {
        switch (scope) {
            case EndpointScope::None: return "";
            case EndpointScope::Publish: return "publish";
            case EndpointScope::Yank: return "yank";
            case EndpointScope::ChangeOwners: return "change-owners";
        }
        return "";
    }

    regauth::core::Status endpoint_scope_from_str(const char* s, EndpointScope* out) noexcept {
        if (s == nullptr || out == nullptr) {
            return invalid();
        }
        if (std::strcmp(s, "publish") == 0) {
            *out = EndpointScope::Publish;
        } else if (std::strcmp(s, "yank") == 0) {
            *out = EndpointScope::Yank;
        } else if (std::strcmp(s, "change-owners") == 0) {
            *out = EndpointScope::ChangeOwners;
        } else {
            return invalid();
        }
        return regauth::core::ok_status();
    }

    bool crate_name_valid(const char* name) noexcept {
        if (name == nullptr) {
            return false;
        }
        return name_chars_valid(name, bounded_len(name, kMaxCrateNameLen));
    }

    bool crate_pattern_valid(const char* pattern) noexcept {
        if (pattern == nullptr) {
            return false;
        }
        const size_t len = bounded_len(pattern, kMaxCrateNameLen + 1);
        if (len == 1 && pattern[0] == '*') {
            return true;
        }
        if (len > 0 && pattern[len - 1] == '*') {
            return name_chars_valid(pattern, len - 1);
        }
        return name_chars_valid(pattern, len);
    }

    regauth::core::Status crate_scope_make(const char* pattern, CratePattern* out) noexcept {
        if (out == nullptr || !crate_pattern_valid(pattern)) {
            return invalid();
        }
        CratePattern p{};
        std::memcpy(p.b, pattern, std::strlen(pattern));
        *out = p;
        return regauth::core::ok_status();
    }

    bool crate_scope_matches(const CratePattern& pattern, const char* crate_name) noexcept {
        if (crate_name == nullptr) {
            return false;
        }
        const char* p = pattern.b;
        if (p[0] == '\0') {
            return false;
        }
        if (p[0] == '*' && p[1] == '\0') {
            return true;
        }

        size_t i = 0;
        for (; p[i] != '\0' && p[i] != '*'; ++i) {
            if (crate_name[i] == '\0' || normalize(crate_name[i]) != normalize(p[i])) {
                return false;
            }
        }
        if (p[i] == '*') {
            return true;
        }
        return crate_name[i] == '\0';
    }

    void crate_scopes_restrict(CrateScopeList* list) noexcept {
        if (list == nullptr) {
            return;
        }
        *list = CrateScopeList{};
        list->restricted = true;
    }

    regauth::core::Status crate_scopes_add(CrateScopeList* list, const char* pattern) noexcept {
        if (list == nullptr) {
            return invalid();
        }
        if (list->len >= kMaxCrateScopes) {
            return regauth::core::make_status(regauth::core::StatusDomain::Security, regauth::core::StatusCode::Conflict);
        }
        CratePattern p{};
        const regauth::core::Status s = crate_scope_make(pattern, &p);
        if (!regauth::core::is_ok(s)) {
            return s;
        }
        list->restricted = true;
        list->items[list->len++] = p;
        return regauth::core::ok_status();
    }

    void endpoint_scopes_restrict(EndpointScopeList* list) noexcept {
        if (list == nullptr) {
            return;
        }
        *list = EndpointScopeList{};
        list->restricted = true;
    }

    regauth::core::Status endpoint_scopes_add(EndpointScopeList* list, EndpointScope scope) noexcept {
        if (list == nullptr || scope == EndpointScope::None) {
            return invalid();
        }
        for (u32 i = 0; i < list->len; ++i) {
            if (list->items[i] == scope) {
                return regauth::core::make_status(regauth::core::StatusDomain::Security, regauth::core::StatusCode::Conflict);
            }
        }
        if (list->len >= kMaxEndpointScopes) {
            return regauth::core::make_status(regauth::core::StatusDomain::Security, regauth::core::StatusCode::Conflict);
        }
        list->restricted = true;
        list->items[list->len++] = scope;
        return regauth::core::ok_status();
    }

    bool crate_scopes_permit(const CrateScopeList& list, const char* crate_name) noexcept {
        if (!list.restricted) {
            return true;
        }
        for (u32 i = 0; i < list.len && i < kMaxCrateScopes; ++i) {
            if (crate_scope_matches(list.items[i], crate_name)) {
                return true;
            }
        }
        return false;
    }

    bool endpoint_scopes_permit(const EndpointScopeList& list, EndpointScope requested) noexcept {
        if (!list.restricted) {
            return true;
        }
        if (requested == EndpointScope::None) {
            return false;
        }
        for (u32 i = 0; i < list.len && i < kMaxEndpointScopes; ++i) {
            if (list.items[i] == requested) {
                return true;
            }
        }
        return false;
    }

    ScopeDecision scope_check(const CrateScopeList& crates,
        const EndpointScopeList& endpoints,
        const ActionRequest& request) noexcept {
        if (!endpoint_scopes_permit(endpoints, request.endpoint)) {
            return ScopeDecision::EndpointDenied;
        }
        if (request.crate_name != nullptr && !crate_scopes_permit(crates, request.crate_name)) {
            return ScopeDecision::CrateDenied;
        }
        return ScopeDecision::Allowed;
    }

    regauth::core::Status crate_scopes_serialize(const CrateScopeList& list, char* out, u32 cap, bool* is_null) noexcept {
        if (out == nullptr || is_null == nullptr || cap == 0) {
            return invalid();
        }
        out[0] = '\0';
        *is_null = !list.restricted;
        if (!list.restricted) {
            return regauth::core::ok_status();
        }

        u32 pos = 0;
        for (u32 i = 0; i < list.len && i < kMaxCrateScopes; ++i) {
            if (i > 0 && !append(out, cap, &pos, ",", 1)) {
                return invalid();
            }
            const char* p = list.items[i].b;
            if (!append(out, cap, &pos, p, std::strlen(p))) {
                return invalid();
            }
        }
        return regauth::core::ok_status();
    }

    regauth::core::Status crate_scopes_parse(const char* text, CrateScopeList* out) noexcept {
        if (out == nullptr) {
            return invalid();
        }
        CrateScopeList list{};
        if (text == nullptr) {
            *out = list;
            return regauth::core::ok_status();
        }
        crate_scopes_restrict(&list);

        const char* cur = text;
        while (*cur != '\0') {
            const char* comma = std::strchr(cur, ',');
            const size_t len = comma ? static_cast<size_t>(comma - cur) : std::strlen(cur);
            if (len == 0 || len > kMaxCrateNameLen + 1) {
                return corrupt();
            }
            char buf[kMaxCrateNameLen + 2]{};
            std::memcpy(buf, cur, len);
            if (!regauth::core::is_ok(crate_scopes_add(&list, buf))) {
                return corrupt();
            }
            if (!comma) {
                break;
            }
            cur = comma + 1;
            if (*cur == '\0') {
                return corrupt();
            }
        }

        *out = list;
        return regauth::core::ok_status();
    }

    regauth::core::Status endpoint_scopes_serialize(const EndpointScopeList& list, char* out, u32 cap, bool* is_null) noexcept {
        if (out == nullptr || is_null == nullptr || cap == 0) {
            return invalid();
        }
        out[0] = '\0';
        *is_null = !list.restricted;
        if (!list.restricted) {
            return regauth::core::ok_status();
        }

        u32 pos = 0;
        for (u32 i = 0; i < list.len && i < kMaxEndpointScopes; ++i) {
            if (i > 0 && !append(out, cap, &pos, ",", 1)) {
                return invalid();
            }
            char num[4]{};
            const auto r = std::to_chars(num, num + sizeof(num), endpoint_scope_encode(list.items[i]));
            if (r.ec != std::errc() || !append(out, cap, &pos, num, static_cast<size_t>(r.ptr - num))) {
                return invalid();
            }
        }
        return regauth::core::ok_status();
    }

    regauth::core::Status endpoint_scopes_parse(const char* text, EndpointScopeList* out) noexcept {
        if (out == nullptr) {
            return invalid();
        }
        EndpointScopeList list{};
        if (text == nullptr) {
            *out = list;
            return regauth::core::ok_status();
        }
        endpoint_scopes_restrict(&list);

        const char* cur = text;
        const char* end = text + std::strlen(text);
        while (cur < end) {
            i64 raw = 0;
            const auto r = std::from_chars(cur, end, raw, 10);
            if (r.ec != std::errc()) {
                return corrupt();
            }
            EndpointScope scope{EndpointScope::None};
            const regauth::core::Status s = endpoint_scope_decode(raw, &scope);
            if (!regauth::core::is_ok(s)) {
                return s;
            }
            if (!regauth::core::is_ok(endpoint_scopes_add(&list, scope))) {
                return corrupt();
            }
            cur = r.ptr;
            if (cur == end) {
                break;
            }
            if (*cur != ',' || cur + 1 == end) {
                return corrupt();
            }
            ++cur;
        }

        *out = list;
        return regauth::core::ok_status();
    }
} // namespace regauth::security
