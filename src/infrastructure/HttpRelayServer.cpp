/**
 * @file HttpRelayServer.cpp
 * @brief Implementation of the HttpRelayServer class.
 */
#include "infrastructure/HttpRelayServer.hpp"
#include "application/WireProtocol.hpp"
#include "infrastructure/HttpEventChannel.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <thread>

using json = nlohmann::json;

namespace voicescribe::infrastructure {

namespace {
constexpr const char* kJsonContentType = "application/json";
}

HttpRelayServer::HttpRelayServer(std::shared_ptr<application::TranscriptionRelay> relay,
                                 std::size_t maxBodyBytes,
                                 std::size_t workerThreads)
    : m_relay(std::move(relay)), m_server(std::make_unique<httplib::Server>()) {
    m_server->set_payload_max_length(maxBodyBytes);

    std::size_t threads = workerThreads == 0 ? 1 : workerThreads;
    m_server->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };

    m_server->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::cout << "[HttpRelayServer] " << req.method << " " << req.path << " -> " << res.status << std::endl;
    });

    registerRoutes();
}

HttpRelayServer::~HttpRelayServer() {
    stop();
}

void HttpRelayServer::registerRoutes() {
    m_server->Get("/api/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(json{{"status", "ok"}}.dump(), kJsonContentType);
    });

    m_server->Post("/api/transcribe", [this](const httplib::Request& req, httplib::Response& res) {
        application::TranscriptionRelay::Reply reply = m_relay->transcribe(req.body);
        res.status = reply.status;
        res.set_content(reply.body.dump(), kJsonContentType);
    });

    m_server->Post("/api/transcribe/stream", [this](const httplib::Request& req, httplib::Response& res) {
        auto channel = std::make_shared<HttpEventChannel>();
        auto relay = m_relay;

        // The pipeline runs on its own thread so this one can start writing
        // the response as soon as the relay commits to streaming.
        auto producer = std::make_shared<std::thread>([relay, channel, body = req.body]() {
            relay->transcribeStream(body, *channel);
            channel->close();
        });

        if (channel->awaitMode() != HttpEventChannel::Mode::Stream) {
            producer->join();
            res.status = channel->status();
            res.set_content(channel->body().dump(), kJsonContentType);
            return;
        }

        res.set_header("Cache-Control", "no-cache");
        res.set_header("X-Accel-Buffering", "no");
        res.set_chunked_content_provider(
            application::WireProtocol::kContentType,
            [channel](size_t, httplib::DataSink& sink) {
                std::string frame;
                if (!channel->next(frame)) {
                    sink.done();
                    return true;
                }
                if (!sink.write(frame.data(), frame.size())) {
                    std::cerr << "[HttpRelayServer] Client stopped reading; cancelling stream" << std::endl;
                    channel->cancel();
                    return false;
                }
                return true;
            },
            [channel, producer](bool) {
                channel->cancel();
                if (producer->joinable()) {
                    producer->join();
                }
            });
    });
}

bool HttpRelayServer::listen(const std::string& host, int port) {
    std::cout << "[HttpRelayServer] Listening on " << host << ":" << port << std::endl;
    if (!m_server->listen(host, port)) {
        std::cerr << "[HttpRelayServer] Could not bind " << host << ":" << port << std::endl;
        return false;
    }
    return true;
}

int HttpRelayServer::bindToAnyPort(const std::string& host) {
    return m_server->bind_to_any_port(host);
}

bool HttpRelayServer::listenAfterBind() {
    return m_server->listen_after_bind();
}

void HttpRelayServer::stop() {
    if (m_server && m_server->is_running()) {
        m_server->stop();
    }
}

} // namespace voicescribe::infrastructure
