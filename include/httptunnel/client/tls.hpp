#pragma once

#include "httptunnel/client/conn.hpp"
#include "httptunnel/net/http_ops.hpp"
#include <boost/asio/ssl.hpp>
#include <string>

namespace httptunnel {

// TLS layered over a tunnelled stream; the Conn must outlive the stream.
using TlsConn = net::ssl::stream<Conn &>;

// SNI → hostname verification → client handshake, all over the tunnel.
inline Status TlsClientHandshake(TlsConn &tls, const std::string &server_name) {
  if (auto st = httpops::SetSni(tls, server_name); !st) {
    return st;
  }
  tls.set_verify_callback(net::ssl::host_name_verification(server_name));
  return httpops::TlsClientHandshake(tls);
}

} // namespace httptunnel
