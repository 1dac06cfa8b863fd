#pragma once
#include <string>
#include "Core/concurrency/CancellationToken.hpp"

class IReadinessCheck {
public:
    virtual ~IReadinessCheck() = default;

    // Blocks until host:port accepts a connection and sends data.
    virtual void waitReady(const std::string& host, int port, const CONCURRENCY::CancellationToken& token) = 0;
};
