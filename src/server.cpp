#include "mcpsrv/server.hpp"
#include "mcpsrv/error.hpp"
#include "mcpsrv/log.hpp"
#include "mcpsrv/response_sequencer.hpp"
#include "mcpsrv/worker_pool.hpp"
#include "mcpsrv/transport/stdio_transport.hpp"

namespace mcpsrv {

McpServer::McpServer(Engine& engine, Options opts)
    : engine_(engine), opts_(opts) {}

McpServer::~McpServer() {
    shutdown();
}

ServeStatus McpServer::serve(std::unique_ptr<ITransport> transport) {
    running_ = true;
    io_error_ = false;

    ITransport* t = transport.get();
    {
        std::lock_guard<std::mutex> lock(transport_mutex_);
        transport_ = t;
    }

    ResponseSequencer sequencer([t](const JsonRpcResponse& resp) {
        try {
            t->send(JsonRpcMessage{resp});
        } catch (const McpTransportError& e) {
            log_debug("server", std::string("Dropping response: ") + e.what());
        }
    });

    std::unique_ptr<WorkerPool> pool;
    if (opts_.workers > 0) {
        pool = std::make_unique<WorkerPool>(opts_.workers);
        log_debug("server", "Pipelined mode with " + std::to_string(opts_.workers) + " workers");
    }

    auto on_message = [this, &sequencer, &pool](nlohmann::json envelope) {
        uint64_t slot = sequencer.reserve();
        Dispatch d = engine_.dispatch(envelope);
        if (!d.is_deferred()) {
            sequencer.complete(slot, std::move(d.response));
            return;
        }
        if (pool) {
            auto work = std::move(d.deferred);
            bool queued = pool->submit([&sequencer, slot, work]() {
                sequencer.complete(slot, work());
            });
            if (queued) return;
            d.deferred = std::move(work);
        }
        sequencer.complete(slot, d.resolve());
    };

    auto on_error = [this, &sequencer](std::exception_ptr err) {
        try {
            std::rethrow_exception(err);
        } catch (const McpParseError& e) {
            log_warn("server", std::string("Parse error: ") + e.what());
            uint64_t slot = sequencer.reserve();
            sequencer.complete(slot, Engine::parse_error(e.what()));
        } catch (const std::exception& e) {
            log_error("server", std::string("Transport failure: ") + e.what());
            io_error_ = true;
        }
    };

    try {
        t->start(on_message, on_error);
    } catch (const McpTransportError& e) {
        log_error("server", std::string("Transport failed to start: ") + e.what());
        io_error_ = true;
    }

    if (pool) {
        pool->stop(WorkerPool::StopMode::Cancel);
    }
    engine_.session().close();

    {
        std::lock_guard<std::mutex> lock(transport_mutex_);
        transport_ = nullptr;
    }
    running_ = false;
    log_info("server", io_error_ ? "Server stopped on I/O error" : "Server stopped");
    return io_error_ ? ServeStatus::IoError : ServeStatus::Eof;
}

ServeStatus McpServer::serve_stdio() {
    StdioTransport::Options topts;
    topts.max_line_bytes = opts_.max_line_bytes;
    return serve(std::make_unique<StdioTransport>(topts));
}

void McpServer::shutdown() {
    std::lock_guard<std::mutex> lock(transport_mutex_);
    if (transport_) {
        transport_->shutdown();
    }
}

bool McpServer::is_running() const {
    return running_;
}

} // namespace mcpsrv
