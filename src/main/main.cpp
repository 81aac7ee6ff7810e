#include "delim_scanner/artifact_writer.hpp"
#include "delim_scanner/chunk_reader.hpp"
#include "delim_scanner/dialect.hpp"
#include "delim_scanner/http_server.hpp"
#include "delim_scanner/path_utils.hpp"
#include "delim_scanner/run_json.hpp"
#include "delim_scanner/scan_session.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct Cli {
  int port = 8080;
  std::string artifact_root = "artifacts/delim-scanner";
  std::string slug_mode = "hashprefix"; // hashprefix|basename|keypath
  int slug_len = 8;
  bool report = false;
  bool serve = false;              // keep serving after the scans
  std::vector<std::string> scans; // explicit file paths, "-" for stdin

  ds::Dialect dialect;
  bool delimiter_set = false;
  std::size_t chunk_bytes = 512 * 1024;
  ds::OutputFormat format = ds::OutputFormat::Jsonl;
  bool typed = false;
  std::string out_path; // records go to stdout when empty
};

[[noreturn]] void usage(int rc) {
  (rc == 0 ? std::cout : std::cerr) <<
    "Usage: delim-scanner [--scan <file>|--scan=<file>]... [--dialect=<json>]\n"
    "                     [--delimiter=C] [--quote=C|--no-quote] [--quote-required]\n"
    "                     [--encoding=utf-8|latin1] [--strip-bom] [--header]\n"
    "                     [--report-unterminated] [--chunk-bytes=N]\n"
    "                     [--format=jsonl|csv|none] [--typed] [--out=<file>]\n"
    "                     [--report] [--artifact-root=DIR]\n"
    "                     [--slug-mode=hashprefix|basename|keypath] [--slug-len=N]\n"
    "                     [--serve] [--port=N]\n"
    "Without --scan (or with --serve), serves reports and POST /parse on --port.\n";
  std::exit(rc);
}

[[noreturn]] void cli_error(const std::string& msg) {
  std::cerr << "[cli] " << msg << "\n";
  std::exit(2);
}

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::strlen(pfx)); return true; }
      return false;
    };
    auto eat_i = [&](const char* pfx, int* out){
      if (a.rfind(pfx, 0) == 0) { *out = std::stoi(a.substr(std::strlen(pfx))); return true; }
      return false;
    };
    std::string v;
    if (eat_i("--port=", &c.port)) continue;
    if (eat("--artifact-root=", &c.artifact_root)) continue;
    if (eat("--slug-mode=", &c.slug_mode)) continue;
    if (eat_i("--slug-len=", &c.slug_len)) continue;
    if (eat("--out=", &c.out_path)) continue;
    if (eat("--dialect=", &v)) {
      std::string err;
      if (!ds::load_dialect(v, c.dialect, &err)) cli_error("dialect: " + err);
      c.delimiter_set = true;
      continue;
    }
    if (eat("--delimiter=", &v)) {
      c.dialect.delimiter = (v == "\\t" || v == "tab") ? "\t" : v;
      c.delimiter_set = true;
      continue;
    }
    if (eat("--quote=", &c.dialect.quote)) continue;
    if (eat("--encoding=", &v)) {
      if (!ds::parse_encoding(v, c.dialect.encoding)) cli_error("unsupported encoding: " + v);
      continue;
    }
    if (eat("--chunk-bytes=", &v)) {
      c.chunk_bytes = static_cast<std::size_t>(std::stoull(v));
      if (c.chunk_bytes == 0) cli_error("--chunk-bytes must be positive");
      continue;
    }
    if (eat("--format=", &v)) {
      if (!ds::parse_output_format(v, c.format)) cli_error("unknown format: " + v);
      continue;
    }
    if (a == "--no-quote")            { c.dialect.quote.clear(); continue; }
    if (a == "--quote-required")      { c.dialect.quote_required = true; continue; }
    if (a == "--strip-bom")           { c.dialect.strip_bom = true; continue; }
    if (a == "--header")              { c.dialect.header = true; continue; }
    if (a == "--report-unterminated") { c.dialect.report_unterminated = true; continue; }
    if (a == "--typed")               { c.typed = true; continue; }
    if (a == "--report")              { c.report = true; continue; }
    if (a == "--serve")               { c.serve = true; continue; }
    if (a == "--scan" && i+1 < argc)  { c.scans.push_back(argv[++i]); continue; }
    if (a.rfind("--scan=",0)==0)      { c.scans.push_back(a.substr(7)); continue; }
    if (a == "-h" || a == "--help")   usage(0);
    cli_error("unknown option: " + a);
  }
  return c;
}

std::string make_slug_for(const std::string& path, const std::string& mode, int len) {
  // For hashprefix mode, hash the full absolute path to be stable in examples.
  std::string key = (mode == "hashprefix" && path != "-")
      ? std::filesystem::weakly_canonical(std::filesystem::path(path)).string()
      : path;
  return ds::make_slug(key, mode, len);
}

const char* content_type_for(const std::string& delimiter) {
  if (delimiter == "\t") return "text/tab-separated-values";
  if (delimiter == ",")  return "text/csv";
  return "text/plain";
}

// 0 ok, 2 I/O or configuration failure, 3 malformed or unterminated input.
int scan_one_file(const std::string& filepath, const Cli& cli, std::ostream& out) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  ds::ScanOptions opts;
  opts.dialect = cli.dialect;
  opts.format = cli.format;
  opts.typed = cli.typed;
  char guessed = 0;
  if (!cli.delimiter_set && ds::delimiter_for_extension(filepath, guessed))
    opts.dialect.delimiter = std::string(1, guessed);

  std::unique_ptr<ds::ScanSession> session;
  try {
    session = std::make_unique<ds::ScanSession>(opts);
  } catch (const ds::ConfigError& e) {
    std::cerr << "[cli] " << e.what() << "\n";
    return 2;
  }

  ds::ChunkReader::Config rcfg;
  rcfg.chunk_bytes = cli.chunk_bytes;
  ds::ChunkReader reader(filepath, rcfg);

  session->metrics().start_stage("parse");
  const bool read_ok = reader.for_each_chunk([&](std::string_view chunk){
    out << session->feed(chunk);
    return static_cast<bool>(out);
  });
  if (!read_ok) {
    std::cerr << "[scan] read failed: " << filepath << ": " << std::strerror(reader.last_error()) << "\n";
    return 2;
  }
  out << session->finish();
  out.flush();
  session->metrics().end_stage("parse");
  if (!out) {
    std::cerr << "[scan] write failed for records of " << filepath << "\n";
    return 2;
  }

  const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
  const auto& m = session->metrics();

  if (cli.report) {
    ds::RunJsonPayload p = session->payload(wall_ms);
    p.filename = filepath;
    p.content_type = content_type_for(opts.dialect.delimiter);
    std::error_code fec;
    if (filepath != "-") {
      const auto size = std::filesystem::file_size(filepath, fec);
      if (!fec) p.file_size = size;
    }

    const std::string slug = make_slug_for(filepath, cli.slug_mode, cli.slug_len);
    std::string err;
    if (!ds::write_report_dir(cli.artifact_root, slug, p, &err)) {
      std::cerr << "[scan] write_report_dir failed: " << err << "\n";
      return 2;
    }
    std::cerr << "[scan] report: " << cli.artifact_root << "/" << slug << "/report.html\n";
  }

  std::cerr << "[scan] ok: " << filepath
            << " records=" << m.records()
            << " errors=" << m.errors()
            << " complete=" << (session->complete() ? "true" : "false") << "\n";
  return (m.errors() == 0 && session->complete()) ? 0 : 3;
}

}

int main(int argc, char** argv) {
  Cli cli;
  try {
    cli = parse_cli(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "[cli] bad numeric option: " << e.what() << "\n";
    return 2;
  }

  int scan_rc = 0;
  if (!cli.scans.empty()) {
    std::ofstream file;
    if (!cli.out_path.empty()) {
      if (!ds::ensure_parent_dirs(cli.out_path)) { std::cerr << "[cli] cannot create dirs for " << cli.out_path << "\n"; return 2; }
      file.open(cli.out_path, std::ios::binary);
      if (!file) { std::cerr << "[cli] cannot open " << cli.out_path << "\n"; return 2; }
    }
    std::ostream& out = cli.out_path.empty() ? std::cout : file;

    for (const auto& f : cli.scans) scan_rc = std::max(scan_rc, scan_one_file(f, cli, out));
    if (!cli.serve) return scan_rc;
  }

  ds::HttpServer::Config cfg;
  cfg.port = cli.port;
  cfg.artifact_root = cli.artifact_root;

  ds::HttpServer server(cfg);
  if (server.run() != 0) {
    std::cerr << "[http] server failed to start on port " << cfg.port << "\n";
    return 2;
  }
  return scan_rc;
}
