#pragma once
#include <optional>
#include <string>

#include "core/RequestRecord.hpp"
#include "core/ResponseSnapshot.hpp"

class Transport {
public:
    virtual ~Transport() = default;

    // Replays `request` with the given header list. An absent body sends the
    // captured body. Network, TLS and timeout failures come back as a snapshot
    // with `error` set and no status; they are never thrown.
    virtual ResponseSnapshot exchange(const RequestRecord& request,
                                      const HeaderList& headers,
                                      const std::optional<std::string>& body) = 0;
};
