#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// Configuration key constants
// ---------------------------------------------------------------------------
inline constexpr const char* CONF_CONF             = "conf";
inline constexpr const char* CONF_ORDER            = "order";
inline constexpr const char* CONF_LISTENERCAPACITY = "listenercapacity";
inline constexpr const char* CONF_LOGLEVEL         = "loglevel";
inline constexpr const char* CONF_DEBUG            = "debug";
inline constexpr const char* CONF_LOGFILE          = "logfile";
inline constexpr const char* CONF_PRINTTOCONSOLE   = "printtoconsole";

// ---------------------------------------------------------------------------
// Config  --  layered key/value configuration
//
// Priority order: command-line args  >  config file / programmatic set.
// Repeated keys (-debug=mempool -debug=mining) accumulate and are returned
// together by get_list().
// ---------------------------------------------------------------------------
class Config {
public:
    Config() = default;

    /// Parse command-line arguments (argv[0] is skipped).
    ///   -key=value   --key=value   (key/value pair)
    ///   -key         --key         (boolean flag, value = "1")
    /// Anything not starting with '-' is kept as a positional argument.
    void parse_args(int argc, const char* const argv[]);

    /// Parse an INI-style file: one key=value per line, '#' comments,
    /// whitespace around key and value trimmed. A bare word is a flag.
    Result<void> parse_file(const std::string& path);

    /// Replace all file-level values for @p key.
    void set(std::string_view key, std::string value);

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    [[nodiscard]] std::string get_or(std::string_view key,
                                     std::string_view default_val) const;

    /// Value parsed as int64; @p default_val when absent, PARSE_BAD_FORMAT
    /// when present but not an integer.
    [[nodiscard]] Result<int64_t> get_int(std::string_view key,
                                          int64_t default_val = 0) const;

    /// Truthy: "1", "true", "yes", "on"; falsy: "0", "false", "no", "off"
    /// (case-insensitive). Anything else yields @p default_val.
    [[nodiscard]] bool get_bool(std::string_view key,
                                bool default_val = false) const;

    /// Every value of @p key, command-line values first.
    [[nodiscard]] std::vector<std::string> get_list(
        std::string_view key) const;

    [[nodiscard]] bool has(std::string_view key) const;

    [[nodiscard]] const std::vector<std::string>& positional_args() const {
        return positional_;
    }

private:
    using ValueMap =
        std::unordered_map<std::string, std::vector<std::string>>;

    ValueMap cli_values_;
    ValueMap file_values_;
    std::vector<std::string> positional_;

    void insert(ValueMap& target, std::string_view key, std::string value);
    [[nodiscard]] const std::vector<std::string>* lookup(
        std::string_view key) const;
};

} // namespace core
