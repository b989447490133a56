/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <atomic>
#include <charconv>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/url.hpp>
#include <cm/chain/rpc-client.hpp>
#include <cm/timer.hpp>

namespace chain_mirror::chain {
    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace net = boost::asio;
    using tcp = boost::asio::ip::tcp;

    namespace rpc {
        uint64_t parse_quantity(const std::string_view hex)
        {
            if (hex.size() < 3 || hex.substr(0, 2) != "0x")
                throw chain_error("invalid quantity: '{}'", hex);
            uint64_t val = 0;
            const auto digits = hex.substr(2);
            const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), val, 16);
            if (ec != std::errc {} || ptr != digits.data() + digits.size())
                throw chain_error("invalid quantity: '{}'", hex);
            return val;
        }

        static std::string string_or_empty(const json::object &obj, const std::string_view name)
        {
            const auto *v = json::find(obj, name);
            if (!v || v->is_null())
                return {};
            return std::string { v->as_string() };
        }

        block parse_block(const json::value &res)
        {
            try {
                const auto &obj = res.as_object();
                block blk {};
                blk.hash = std::string { obj.at("hash").as_string() };
                blk.parent_hash = std::string { obj.at("parentHash").as_string() };
                blk.number = parse_quantity(obj.at("number").as_string());
                blk.timestamp = parse_quantity(obj.at("timestamp").as_string());
                for (const auto &tx: obj.at("transactions").as_array()) {
                    if (!tx.is_object())
                        throw chain_error("block {} must be requested with full transaction objects", blk.hash);
                    const auto &tx_obj = tx.as_object();
                    blk.transactions.emplace_back(transaction { std::string { tx_obj.at("hash").as_string() }, string_or_empty(tx_obj, "to") });
                }
                return blk;
            } catch (const chain_error &) {
                throw;
            } catch (const std::exception &ex) {
                throw chain_error(fmt::format("malformed block: {}", json::serialize(res)), ex);
            }
        }

        receipt parse_receipt(const json::value &res)
        {
            try {
                const auto &obj = res.as_object();
                receipt r {};
                r.tx_hash = std::string { obj.at("transactionHash").as_string() };
                r.to = string_or_empty(obj, "to");
                // receipts of blocks preceding the status field carry a state root instead
                if (const auto status = string_or_empty(obj, "status"); !status.empty())
                    r.status = parse_quantity(status) == 1;
                for (const auto &l: obj.at("logs").as_array()) {
                    const auto &l_obj = l.as_object();
                    log_entry le {};
                    le.address = std::string { l_obj.at("address").as_string() };
                    for (const auto &t: l_obj.at("topics").as_array())
                        le.topics.emplace_back(t.as_string());
                    le.data = std::string { l_obj.at("data").as_string() };
                    r.logs.emplace_back(std::move(le));
                }
                return r;
            } catch (const chain_error &) {
                throw;
            } catch (const std::exception &ex) {
                throw chain_error(fmt::format("malformed receipt: {}", json::serialize(res)), ex);
            }
        }

        json::object make_request(const uint64_t id, const std::string_view method, json::array params)
        {
            return json::object {
                { "jsonrpc", "2.0" },
                { "id", id },
                { "method", method },
                { "params", std::move(params) }
            };
        }

        json::value take_result(json::value &&resp, const uint64_t expected_id)
        {
            if (!resp.is_object())
                throw chain_error("JSON-RPC response must be an object but got: {}", json::serialize(resp));
            auto &obj = resp.as_object();
            if (const auto *err = json::find(obj, "error"); err && !err->is_null())
                throw chain_error("JSON-RPC error: {}", json::serialize(*err));
            if (const auto *id = json::find(obj, "id"); !id || !id->is_number() || json::value_to<uint64_t>(*id) != expected_id)
                throw chain_error("JSON-RPC response id does not match the request id {}", expected_id);
            auto *res = obj.if_contains("result");
            if (!res || res->is_null())
                throw chain_error("JSON-RPC response has no result: {}", json::serialize(resp));
            return std::move(*res);
        }
    }

    struct rpc_client::impl {
        impl(const std::string &url, const std::chrono::milliseconds timeout)
            : _url { url }, _timeout { timeout }
        {
            boost::url_view uri { url };
            if (uri.scheme() != "http")
                throw error("only http urls are supported but got {}", url);
            _host = uri.host();
            _port = uri.port().empty() ? std::string { "80" } : std::string { uri.port() };
            _target = uri.path().empty() ? std::string { "/" } : uri.path();
            if (uri.has_query())
                _target += fmt::format("?{}", std::string_view { uri.encoded_query() });
            logger::info("chain RPC endpoint: {} timeout: {} ms", _url, _timeout.count());
        }

        json::value call(const std::string_view method, json::array params) const
        {
            timer t { fmt::format("rpc {}", method), logger::level::trace };
            const auto id = _next_id.fetch_add(1) + 1;
            const auto body = json::serialize(rpc::make_request(id, method, std::move(params)));
            logger::trace("rpc request: {}", body);
            const auto resp_body = _post(body);
            json::value resp {};
            try {
                resp = json::parse(resp_body);
            } catch (const std::exception &ex) {
                throw chain_error(fmt::format("invalid JSON in the response to {}", method), ex);
            }
            return rpc::take_result(std::move(resp), id);
        }
    private:
        const std::string _url;
        const std::chrono::milliseconds _timeout;
        std::string _host {};
        std::string _port {};
        std::string _target {};
        mutable std::atomic_uint64_t _next_id { 0 };

        std::string _post(const std::string &body) const
        {
            net::io_context ioc {};
            tcp::resolver resolver { ioc };
            beast::tcp_stream stream { ioc };
            http::request<http::string_body> req { http::verb::post, _target, 11 };
            req.set(http::field::host, _host);
            req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
            req.set(http::field::content_type, "application/json");
            req.body() = body;
            req.prepare_payload();
            beast::flat_buffer buffer {};
            http::response_parser<http::string_body> parser {};
            parser.body_limit(1 << 26);
            std::optional<std::string> failure {};

            const auto fail = [&](const std::string_view stage, const beast::error_code &ec) {
                failure.emplace(fmt::format("{} failed: {}", stage, ec.message()));
            };
            resolver.async_resolve(_host, _port, [&](const beast::error_code &ec, const tcp::resolver::results_type &results) {
                if (ec)
                    return fail("async_resolve", ec);
                stream.expires_after(_timeout);
                stream.async_connect(results, [&](const beast::error_code &ec, const tcp::endpoint &) {
                    if (ec)
                        return fail("async_connect", ec);
                    stream.expires_after(_timeout);
                    http::async_write(stream, req, [&](const beast::error_code &ec, std::size_t) {
                        if (ec)
                            return fail("async_write", ec);
                        stream.expires_after(_timeout);
                        http::async_read(stream, buffer, parser, [&](const beast::error_code &ec, std::size_t) {
                            if (ec)
                                return fail("async_read", ec);
                        });
                    });
                });
            });
            // the tcp_stream deadlines do not cover name resolution, so the whole exchange has its own bound
            ioc.run_for(_timeout * 3);
            if (!ioc.stopped())
                throw chain_error("request to {} has timed out", _url);
            if (failure)
                throw chain_error("request to {}: {}", _url, *failure);
            const auto &res = parser.get();
            if (res.result_int() != 200)
                throw chain_error("request to {}: bad http status: {}", _url, res.result_int());
            return res.body();
        }
    };

    rpc_client::rpc_client(const std::string &url, const std::chrono::milliseconds timeout)
        : _impl { std::make_unique<impl>(url, timeout) }
    {
    }

    rpc_client::~rpc_client() =default;

    block rpc_client::_latest_impl() const
    {
        return rpc::parse_block(_impl->call("eth_getBlockByNumber", json::array { "latest", true }));
    }

    block rpc_client::_block_by_number_impl(const uint64_t number) const
    {
        return rpc::parse_block(_impl->call("eth_getBlockByNumber", json::array { fmt::format("0x{:x}", number), true }));
    }

    block rpc_client::_block_by_hash_impl(const std::string &hash) const
    {
        return rpc::parse_block(_impl->call("eth_getBlockByHash", json::array { hash, true }));
    }

    receipt rpc_client::_receipt_impl(const std::string &tx_hash) const
    {
        return rpc::parse_receipt(_impl->call("eth_getTransactionReceipt", json::array { tx_hash }));
    }
}
