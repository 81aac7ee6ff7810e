#include "delim_scanner/http_server.hpp"
#include "delim_scanner/scan_session.hpp"
#include <httplib.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace ds {

static std::string guess_mime(const std::string& name) {
  auto ends = [&](const char* s){
    const size_t n = std::strlen(s), m = name.size();
    return m >= n && std::equal(s, s+n, name.c_str() + (m - n),
                                [](char a, char b){ return std::tolower((unsigned char)a)==std::tolower((unsigned char)b); });
  };
  if (ends(".html")) return "text/html; charset=utf-8";
  if (ends(".css"))  return "text/css; charset=utf-8";
  if (ends(".json")) return "application/json; charset=utf-8";
  if (ends(".txt"))  return "text/plain; charset=utf-8";
  return "application/octet-stream";
}

static bool flag_param(const httplib::Request& req, const char* key) {
  if (!req.has_param(key)) return false;
  const std::string v = req.get_param_value(key);
  return v.empty() || v == "1" || v == "true";
}

// Query parameters -> ScanOptions. Returns false with a message on bad input.
static bool options_from_query(const httplib::Request& req, ScanOptions& opts, std::string& err) {
  opts.format = OutputFormat::Jsonl;
  opts.inline_errors = true;
  if (req.has_param("delimiter")) opts.dialect.delimiter = req.get_param_value("delimiter");
  if (req.has_param("quote"))     opts.dialect.quote     = req.get_param_value("quote");
  if (req.has_param("encoding") &&
      !parse_encoding(req.get_param_value("encoding"), opts.dialect.encoding)) {
    err = "unsupported encoding";
    return false;
  }
  opts.dialect.quote_required = flag_param(req, "quote_required");
  opts.dialect.header         = flag_param(req, "header");
  opts.dialect.strip_bom      = flag_param(req, "strip_bom");
  opts.typed                  = flag_param(req, "typed");
  return true;
}

struct HttpServer::Impl {
  Config cfg;
  httplib::Server svr;

  explicit Impl(Config c) : cfg(std::move(c)) {}

  std::vector<std::string> slugs() const {
    std::vector<std::string> out;
    std::filesystem::path root(cfg.artifact_root);
    std::error_code ec;
    if (!std::filesystem::exists(root, ec)) return out;
    for (auto& d : std::filesystem::directory_iterator(root, ec)) {
      if (d.is_directory()) out.push_back(d.path().filename().string());
    }
    std::sort(out.begin(), out.end());
    return out;
  }

  static std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
      switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        default: out.push_back(c);
      }
    }
    return out;
  }

  std::string index_html() const {
    auto items = slugs();
    const std::string title = html_escape(cfg.index_title);
    std::string html = "<!doctype html><html><head><meta charset='utf-8'><title>";
    html += title + "</title></head><body><h1>" + title + "</h1><ul>";
    for (auto& s : items) {
      const std::string e = html_escape(s);
      html += "<li><a href=\"/reports/" + e + "/report.html\">" + e + "</a></li>";
    }
    html += "</ul></body></html>";
    return html;
  }

  // Serve a file under artifact_root/<slug>/<rel>, preventing traversal.
  void serve_under_slug(const std::string& slug,
                        const std::string& rel,
                        httplib::Response& res) const {
    if (rel.find("..") != std::string::npos || slug.find("..") != std::string::npos) {
      res.status = 400; return;
    }

    std::filesystem::path base = std::filesystem::path(cfg.artifact_root) / slug;
    std::error_code ec;
    auto base_canon = std::filesystem::weakly_canonical(base, ec);
    if (ec) { res.status = 404; return; }

    auto target_canon = std::filesystem::weakly_canonical(base_canon / rel, ec);
    if (ec) { res.status = 404; return; }

    // Ensure target is inside base
    auto mismatch = std::mismatch(base_canon.begin(), base_canon.end(), target_canon.begin(), target_canon.end());
    if (mismatch.first != base_canon.end()) { res.status = 403; return; }

    std::ifstream in(target_canon, std::ios::binary);
    if (!in) { res.status = 404; return; }

    std::ostringstream ss; ss << in.rdbuf();
    res.set_content(ss.str(), guess_mime(target_canon.filename().string()).c_str());
  }

  // Each body chunk goes to the parser as it is received from the socket.
  void parse_body(const httplib::Request& req, httplib::Response& res,
                  const httplib::ContentReader& content_reader) const {
    if (req.is_multipart_form_data()) {
      res.status = 415;
      res.set_content("multipart bodies are not supported\n", "text/plain; charset=utf-8");
      return;
    }
    ScanOptions opts;
    std::string err;
    if (!options_from_query(req, opts, err)) {
      res.status = 400;
      res.set_content(err + "\n", "text/plain; charset=utf-8");
      return;
    }
    try {
      ScanSession session(opts);
      std::string out;
      const bool received = content_reader([&](const char* data, size_t len) {
        out += session.feed(std::string_view(data, len));
        return true;
      });
      if (!received) {
        res.status = 400;
        res.set_content("failed to read request body\n", "text/plain; charset=utf-8");
        return;
      }
      out += session.finish();
      out += "{\"records\":" + std::to_string(session.metrics().records()) +
             ",\"errors\":" + std::to_string(session.metrics().errors()) +
             ",\"complete\":" + (session.complete() ? "true" : "false") + "}\n";
      res.set_content(out, "application/x-ndjson");
    } catch (const ConfigError& e) {
      res.status = 400;
      res.set_content(std::string(e.what()) + "\n", "text/plain; charset=utf-8");
    }
  }

  void routes() {
    svr.Get("/", [this](const httplib::Request&, httplib::Response& res) {
      res.set_content(index_html(), "text/html; charset=utf-8");
    });

    svr.Get(R"(/reports/([^/]+)/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
      serve_under_slug(req.matches[1].str(), req.matches[2].str(), res);
    });

    svr.Post("/parse", [this](const httplib::Request& req, httplib::Response& res,
                              const httplib::ContentReader& content_reader) {
      parse_body(req, res, content_reader);
    });
  }
};

HttpServer::HttpServer(Config cfg) : p_(new Impl(std::move(cfg))) { p_->routes(); }
HttpServer::~HttpServer() { delete p_; }

bool HttpServer::start() {
  return p_->svr.bind_to_port(p_->cfg.host, p_->cfg.port);
}

int HttpServer::run() {
  if (!start()) return -1;
  std::cerr << "[http] listening on " << p_->cfg.host << ":" << p_->cfg.port << "\n";
  return p_->svr.listen_after_bind() ? 0 : -1;
}

void HttpServer::stop() { p_->svr.stop(); }
bool HttpServer::running() const { return p_->svr.is_running(); }

}
