#pragma once

#include "blobup/net/http.hpp"

#include <memory>

namespace blobup::net {

// Seam between the upload engine and the wire.
// start() must not block on the transfer; the engine polls the returned
// operation while sampling the body source's progress.
class Transport {
public:
    virtual ~Transport() = default;

    // Begin a transfer and return immediately
    virtual std::unique_ptr<HttpAsyncOperation> start(const HttpRequest& request) = 0;

    // Blocking request (small GETs such as server discovery)
    virtual HttpResponse execute(const HttpRequest& request) = 0;
};

// libcurl-backed transport
class CurlTransport : public Transport {
public:
    explicit CurlTransport(const HttpClientConfig& config = {});

    std::unique_ptr<HttpAsyncOperation> start(const HttpRequest& request) override;
    HttpResponse execute(const HttpRequest& request) override;


private:
    HttpClient client_;
};

} // namespace blobup::net
