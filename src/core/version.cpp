/// @file version.cpp
/// @brief Version parsing and engine requirement matching

#include <relay/core/version.hpp>

#include <array>
#include <charconv>
#include <utility>

namespace relay_core {

namespace {

constexpr Version k_relay_version{1, 2, 0};

std::string_view trim(std::string_view s) {
    auto first = s.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

bool read_component(std::string_view part, std::uint16_t& out) {
    if (part.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), out);
    return ec == std::errc{} && ptr == part.data() + part.size();
}

bool satisfies(const VersionRange::Clause& clause, const Version& v) {
    switch (clause.op) {
        case VersionRange::Op::Eq: return v == clause.version;
        case VersionRange::Op::Lt: return v < clause.version;
        case VersionRange::Op::Le: return v <= clause.version;
        case VersionRange::Op::Gt: return v > clause.version;
        case VersionRange::Op::Ge: return v >= clause.version;
    }
    return false;
}

/// Longest prefixes first so ">=" wins over ">"
constexpr std::array<std::pair<std::string_view, VersionRange::Op>, 6> k_prefixes{{
    {">=", VersionRange::Op::Ge},
    {"<=", VersionRange::Op::Le},
    {"==", VersionRange::Op::Eq},
    {">", VersionRange::Op::Gt},
    {"<", VersionRange::Op::Lt},
    {"=", VersionRange::Op::Eq},
}};

Result<void> append_clauses(std::string_view text, VersionRange& range) {
    auto bad = [&] {
        return Err(Error(ErrorCode::ParseError, "Invalid version in range: " + std::string(text)));
    };

    if (text.front() == '^' || text.front() == '~') {
        auto base = Version::parse(trim(text.substr(1)));
        if (!base) {
            return bad();
        }
        Version upper = text.front() == '^'
            ? Version{static_cast<std::uint16_t>(base->major + 1), 0, 0}
            : Version{base->major, static_cast<std::uint16_t>(base->minor + 1), 0};
        range.clauses.push_back({VersionRange::Op::Ge, *base});
        range.clauses.push_back({VersionRange::Op::Lt, upper});
        return Ok();
    }

    auto op = VersionRange::Op::Eq;
    for (const auto& [prefix, prefix_op] : k_prefixes) {
        if (text.starts_with(prefix)) {
            op = prefix_op;
            text.remove_prefix(prefix.size());
            break;
        }
    }

    auto version = Version::parse(trim(text));
    if (!version) {
        return bad();
    }
    range.clauses.push_back({op, *version});
    return Ok();
}

} // anonymous namespace

// =============================================================================
// Version
// =============================================================================

std::optional<Version> Version::parse(std::string_view text) {
    std::array<std::uint16_t, 3> parts{0, 0, 0};
    std::size_t count = 0;

    while (true) {
        if (count == parts.size()) {
            return std::nullopt;
        }
        auto dot = text.find('.');
        if (!read_component(text.substr(0, dot), parts[count++])) {
            return std::nullopt;
        }
        if (dot == std::string_view::npos) {
            break;
        }
        text.remove_prefix(dot + 1);
    }

    if (count < 2) {
        return std::nullopt;
    }
    return Version{parts[0], parts[1], parts[2]};
}

std::string Version::to_string() const {
    return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

Version relay_version() {
    return k_relay_version;
}

// =============================================================================
// VersionRange
// =============================================================================

bool VersionRange::contains(const Version& v) const {
    for (const auto& clause : clauses) {
        if (!satisfies(clause, v)) {
            return false;
        }
    }
    return true;
}

Result<VersionRange> parse_version_range(const std::string& str) {
    VersionRange range;
    std::string_view rest = str;

    while (!rest.empty()) {
        auto comma = rest.find(',');
        auto clause = trim(rest.substr(0, comma));
        if (!clause.empty()) {
            auto added = append_clauses(clause, range);
            if (!added) {
                return Err<VersionRange>(added.error());
            }
        }
        if (comma == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(comma + 1);
    }

    if (range.clauses.empty()) {
        return Err<VersionRange>(Error(ErrorCode::ParseError, "Empty version range"));
    }
    return Ok(std::move(range));
}

} // namespace relay_core
