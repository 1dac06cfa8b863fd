#include "Virtualization/vmm/QmpClient.hpp"
#include "System/Logger.hpp"
#include "Virtualization/Utils/VmException.hpp"

#include <array>
#include <boost/asio.hpp>

namespace asio = boost::asio;
using stream_protocol = asio::local::stream_protocol;

namespace {

constexpr std::size_t kMaxMessageBytes = 1024 * 1024;

// One connection to the monitor; every blocking step is bounded by the I/O timeout.
class QmpSession {
public:
    QmpSession(std::string socketPath, std::chrono::milliseconds timeout)
        : socketPath(std::move(socketPath)), timeout(timeout), socket(io) {}

    void connect() {
        stream_protocol::endpoint endpoint;
        try {
            // sun_path is limited to ~108 bytes; asio throws when the path does not fit
            endpoint = stream_protocol::endpoint(socketPath);
        } catch (const boost::system::system_error& e) {
            throw ProtocolFailure("monitor path " + socketPath + ": " + e.code().message());
        }

        boost::system::error_code result = asio::error::would_block;
        socket.async_connect(endpoint, [&](const boost::system::error_code& ec) { result = ec; });
        runFor("connect");
        if (result) throw ProtocolFailure("connect " + socketPath + ": " + result.message());
    }

    std::string readMessage() {
        for (;;) {
            if (auto msg = QmpClient::extractMessage(pending)) return *msg;
            if (pending.size() > kMaxMessageBytes) {
                throw ProtocolFailure("reply exceeds " + std::to_string(kMaxMessageBytes) + " bytes");
            }

            boost::system::error_code result = asio::error::would_block;
            std::size_t received = 0;
            socket.async_read_some(asio::buffer(chunk),
                                   [&](const boost::system::error_code& ec, std::size_t n) {
                                       result = ec;
                                       received = n;
                                   });
            runFor("read");
            if (result) throw ProtocolFailure("read " + socketPath + ": " + result.message());
            pending.append(chunk.data(), received);
        }
    }

    void send(const nlohmann::json& message) {
        const std::string wire = message.dump() + "\r\n";
        QHLOG_TRACE("QMP -> {}", message.dump());
        boost::system::error_code result = asio::error::would_block;
        asio::async_write(socket, asio::buffer(wire),
                          [&](const boost::system::error_code& ec, std::size_t) { result = ec; });
        runFor("write");
        if (result) throw ProtocolFailure("write " + socketPath + ": " + result.message());
    }

private:
    void runFor(const char* step) {
        io.restart();
        io.run_for(timeout);
        if (!io.stopped()) {
            boost::system::error_code ignored;
            socket.close(ignored);
            io.run();
            throw ProtocolFailure(std::string(step) + " on " + socketPath + " timed out after " +
                                  std::to_string(timeout.count()) + " ms");
        }
    }

    std::string socketPath;
    std::chrono::milliseconds timeout;
    asio::io_context io;
    stream_protocol::socket socket;
    std::array<char, 4096> chunk{};
    std::string pending;
};

// Skips asynchronous events until a reply carrying "return" or "error" arrives.
nlohmann::json readReply(QmpSession& session) {
    for (;;) {
        const std::string text = session.readMessage();
        QHLOG_TRACE("QMP <- {}", text);
        auto reply = nlohmann::json::parse(text, nullptr, false);
        if (reply.is_discarded() || !reply.is_object()) {
            throw ProtocolFailure("malformed reply: " + text);
        }
        if (reply.contains("event")) {
            QHLOG_DEBUG("QMP event while waiting for reply: {}", reply["event"].dump());
            continue;
        }
        if (reply.contains("return") || reply.contains("error")) {
            return reply;
        }
        throw ProtocolFailure("unexpected reply shape: " + text);
    }
}

// Removes pending[start, eol] and returns it without the line terminator.
std::string takeLine(std::string& pending, std::size_t start, std::size_t eol) {
    std::size_t end = eol;
    if (end > start && pending[end - 1] == '\r') --end;
    std::string line = pending.substr(start, end - start);
    pending.erase(0, eol + 1);
    return line;
}

} // namespace

QmpClient::QmpClient(std::filesystem::path socketPath, std::chrono::milliseconds ioTimeout)
    : path(std::move(socketPath)), ioTimeout(ioTimeout) {}

bool QmpClient::isQuery(std::string_view command) noexcept {
    return command.substr(0, kQueryPrefix.size()) == kQueryPrefix;
}

std::optional<std::string> QmpClient::extractMessage(std::string& pending) {
    const std::size_t start = pending.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        pending.clear();
        return std::nullopt;
    }

    if (pending[start] != '{') {
        // Not an object; hand back the line so the caller can report it.
        const std::size_t eol = pending.find('\n', start);
        if (eol == std::string::npos) return std::nullopt;
        return takeLine(pending, start, eol);
    }

    int depth = 0;
    bool inString = false;
    bool escaped = false;
    for (std::size_t i = start; i < pending.size(); ++i) {
        const char c = pending[i];
        if (inString) {
            if (escaped) escaped = false;
            else if (c == '\\') escaped = true;
            else if (c == '"') inString = false;
            continue;
        }
        if (c == '"') {
            inString = true;
        } else if (c == '\n') {
            // QEMU ends every message with CRLF, so an open object at end of line is malformed
            return takeLine(pending, start, i);
        } else if (c == '{') {
            ++depth;
        } else if (c == '}' && --depth == 0) {
            std::string message = pending.substr(start, i - start + 1);
            pending.erase(0, i + 1);
            return message;
        }
    }
    return std::nullopt;
}

nlohmann::json QmpClient::runCommand(const std::string& command, const nlohmann::json& arguments) {
    QmpSession session(path.string(), ioTimeout);
    session.connect();

    // The greeting must be readable; its content is informational only.
    const std::string greeting = session.readMessage();
    auto parsedGreeting = nlohmann::json::parse(greeting, nullptr, false);
    if (parsedGreeting.is_discarded() || !parsedGreeting.is_object() || !parsedGreeting.contains("QMP")) {
        QHLOG_DEBUG("ignoring unparseable QMP greeting: {}", greeting);
    } else {
        QHLOG_TRACE("QMP greeting: {}", parsedGreeting["QMP"].dump());
    }

    session.send({{"execute", "qmp_capabilities"}});
    const auto handshake = readReply(session);
    if (handshake.contains("error")) {
        throw ProtocolFailure("qmp_capabilities failed: " + handshake["error"].dump());
    }
    if (!handshake["return"].empty()) {
        throw ProtocolFailure("qmp_capabilities failed: " + handshake["return"].dump());
    }

    nlohmann::json request{{"execute", command}};
    if (!arguments.is_null() && !arguments.empty()) {
        request["arguments"] = arguments;
    }
    session.send(request);

    const auto reply = readReply(session);
    if (reply.contains("error")) {
        throw CommandFailure(command, reply["error"].dump());
    }
    const nlohmann::json& result = reply["return"];
    if (isQuery(command)) {
        return result;
    }
    // non-query commands must answer with an empty object
    if (!result.empty()) {
        throw CommandFailure(command, result.dump());
    }
    return result;
}
