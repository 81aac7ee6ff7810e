#pragma once
#include <string>

namespace ds {

// Tiny wrapper around cpp-httplib:
//   GET  /                          index of report slugs
//   GET  /reports/<slug>/<file>     report files
//   POST /parse?delimiter=;&quote=&quote_required=1&header=1&typed=1
//        body streamed through a parser as it arrives; JSON lines back
class HttpServer {
public:
  struct Config {
    std::string artifact_root = "artifacts/delim-scanner";
    std::string index_title   = "Delim Scanner Reports";
    std::string host = "0.0.0.0";
    int port = 8080;
  };

  explicit HttpServer(Config cfg);
  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  ~HttpServer();

  // Binds the port; returns false on bind error.
  bool start();

  // Blocking run (binds first); returns when server stops.
  int run();

  // Stop if running.
  void stop();

  bool running() const;

private:
  struct Impl;
  Impl* p_;
};

}
