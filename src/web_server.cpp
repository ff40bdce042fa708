#include "navis/web_server.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <csignal>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace navis
{
    namespace
    {
        constexpr std::string_view kApiPrefix = "/api/";

        http::response<http::string_body> json_response(http::status status, const nlohmann::json &j, unsigned version)
        {
            http::response<http::string_body> res{status, version};
            res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
            res.set(http::field::content_type, "application/json");
            res.body() = j.dump();
            res.prepare_payload();
            return res;
        }

        http::response<http::string_body> ok_json(const nlohmann::json &j, unsigned version)
        {
            return json_response(http::status::ok, j, version);
        }

        http::response<http::string_body> error_json(http::status status, const std::string &why,
                                                     const std::string &code, unsigned version)
        {
            return json_response(status, {{"error", why}, {"code", code}}, version);
        }

        http::status status_for(ErrorCode code)
        {
            switch (code)
            {
            case ErrorCode::NotFound:
                return http::status::not_found;
            case ErrorCode::InvalidInput:
            case ErrorCode::ParsingError:
            case ErrorCode::ValidationError:
            case ErrorCode::NoCandidatesAvailable:
            case ErrorCode::EmptyCandidateSet:
                return http::status::bad_request;
            default:
                return http::status::internal_server_error;
            }
        }
    } // namespace

    class WebServer::Impl
    {
    public:
        Impl(const ServerConfig &cfg, ApiService &api)
            : cfg_(cfg),
              api_(api),
              ioc_(static_cast<int>(cfg.threads)),
              acceptor_(ioc_)
        {
        }

        ~Impl()
        {
            stop();
        }

        void run()
        {
            tcp::endpoint endpoint{net::ip::make_address(cfg_.address), cfg_.port};
            beast::error_code ec;

            acceptor_.open(endpoint.protocol(), ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.bind(endpoint, ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.listen(net::socket_base::max_listen_connections, ec);
            if (ec)
                throw beast::system_error{ec};

            spdlog::info("Listening on {}:{} with {} threads", cfg_.address, cfg_.port, cfg_.threads);
            do_accept();

            net::signal_set signals(ioc_, SIGINT, SIGTERM);
            signals.async_wait([this](beast::error_code, int)
                               { stop(); });

            std::vector<std::thread> threads;
            threads.reserve(cfg_.threads);
            for (std::size_t i = 0; i < cfg_.threads; ++i)
            {
                threads.emplace_back([this]
                                     { ioc_.run(); });
            }

            for (auto &t : threads)
                t.join();
            spdlog::info("Server stopped");
        }

        void stop()
        {
            beast::error_code ec;
            acceptor_.cancel(ec);
            acceptor_.close(ec);
            ioc_.stop();
        }

    private:
        void do_accept()
        {
            acceptor_.async_accept(
                net::make_strand(ioc_),
                beast::bind_front_handler(&Impl::on_accept, this));
        }

        void on_accept(beast::error_code ec, tcp::socket socket)
        {
            if (!ec)
            {
                std::make_shared<Session>(std::move(socket), api_, api_mutex_)->run();
            }
            else if (ec != net::error::operation_aborted)
            {
                spdlog::warn("Accept failed: {}", ec.message());
            }
            if (acceptor_.is_open())
                do_accept();
        }

        class Session : public std::enable_shared_from_this<Session>
        {
        public:
            Session(tcp::socket socket, ApiService &api, std::mutex &api_mutex)
                : stream_(std::move(socket)),
                  api_(api),
                  api_mutex_(api_mutex)
            {
            }

            void run()
            {
                net::dispatch(stream_.get_executor(),
                              beast::bind_front_handler(&Session::do_read, shared_from_this()));
            }

        private:
            void do_read()
            {
                req_ = {};
                stream_.expires_after(std::chrono::seconds(30));
                http::async_read(stream_, buffer_, req_,
                                 beast::bind_front_handler(&Session::on_read, shared_from_this()));
            }

            void on_read(beast::error_code ec, std::size_t)
            {
                if (ec == http::error::end_of_stream)
                {
                    return do_close();
                }
                if (ec)
                {
                    spdlog::debug("Read failed: {}", ec.message());
                    return;
                }

                res_ = handle_request(req_);
                do_write();
            }

            void do_write()
            {
                auto self = shared_from_this();
                http::async_write(stream_, res_,
                                  [self](beast::error_code ec, std::size_t)
                                  {
                                      self->on_write(ec);
                                  });
            }

            void on_write(beast::error_code ec)
            {
                if (ec)
                {
                    spdlog::debug("Write failed: {}", ec.message());
                    return;
                }
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            }

            void do_close()
            {
                beast::error_code ec;
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            }

            http::response<http::string_body> dispatch(const std::string &operation, const nlohmann::json &body,
                                                       unsigned version)
            {
                Result<nlohmann::json> result = [&]
                {
                    std::lock_guard lock(api_mutex_);
                    return api_.handle(operation, body);
                }();

                if (!result)
                {
                    const auto &err = result.error();
                    spdlog::info("{} failed: {}", operation, err.what());
                    return error_json(status_for(err.code), err.what(), error_code_to_string(err.code), version);
                }
                return ok_json(*result, version);
            }

            http::response<http::string_body> handle_request(const http::request<http::string_body> &req)
            {
                const unsigned version = req.version();
                const std::string target(req.target());

                if (req.method() != http::verb::get && req.method() != http::verb::post)
                {
                    return error_json(http::status::method_not_allowed, "method not allowed",
                                      "method_not_allowed", version);
                }

                if (target == "/health")
                {
                    if (req.method() != http::verb::get)
                        return error_json(http::status::method_not_allowed, "method not allowed",
                                          "method_not_allowed", version);
                    return dispatch("health", nlohmann::json::object(), version);
                }

                if (target.rfind(kApiPrefix, 0) != 0)
                {
                    return error_json(http::status::not_found, "not found", "not_found", version);
                }

                const std::string operation = target.substr(kApiPrefix.size());
                if (operation == "statistics" || operation == "health")
                {
                    if (req.method() != http::verb::get)
                        return error_json(http::status::method_not_allowed, "method not allowed",
                                          "method_not_allowed", version);
                    return dispatch(operation, nlohmann::json::object(), version);
                }

                if (req.method() != http::verb::post)
                {
                    return error_json(http::status::method_not_allowed, "method not allowed",
                                      "method_not_allowed", version);
                }

                auto body = nlohmann::json::parse(req.body(), nullptr, false);
                if (body.is_discarded())
                {
                    return error_json(http::status::bad_request, "request body is not valid JSON",
                                      error_code_to_string(ErrorCode::ParsingError), version);
                }
                return dispatch(operation, body, version);
            }

            beast::tcp_stream stream_;
            beast::flat_buffer buffer_;
            http::request<http::string_body> req_;
            http::response<http::string_body> res_;
            ApiService &api_;
            std::mutex &api_mutex_;
        };

        ServerConfig cfg_;
        ApiService &api_;
        std::mutex api_mutex_;
        net::io_context ioc_;
        tcp::acceptor acceptor_;
    };

    WebServer::WebServer(const ServerConfig &cfg, ApiService &api) : impl_(std::make_unique<Impl>(cfg, api)) {}
    WebServer::~WebServer() = default;

    void WebServer::run() { impl_->run(); }
    void WebServer::stop() { impl_->stop(); }

} // namespace navis
