// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/channel.h"

namespace core {

ChannelClosedError::ChannelClosedError()
    : std::runtime_error("receive on closed channel") {}

ChannelClosedError::ChannelClosedError(const std::string& message)
    : std::runtime_error(message) {}

std::string_view send_status_name(SendStatus status) noexcept {
    switch (status) {
        case SendStatus::SENT:   return "sent";
        case SendStatus::FULL:   return "full";
        case SendStatus::CLOSED: return "closed";
    }
    return "unknown";
}

}  // namespace core
