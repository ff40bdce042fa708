#pragma once

#include "api_service.hpp"
#include "config.hpp"
#include <memory>

namespace navis
{

    /**
     * HTTP binding for ApiService using Boost.Beast.
     *
     *   GET  /health
     *   GET  /api/statistics
     *   POST /api/<operation>
     *
     * Errors are JSON {"error", "code"} with 400, 404, 405 or 500.
     */
    class WebServer
    {
    public:
        WebServer(const ServerConfig &cfg, ApiService &api);
        ~WebServer();

        /** Start the server and block until stopped. */
        void run();

        /** Request a stop; active connections complete gracefully. */
        void stop();

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };

} // namespace navis
