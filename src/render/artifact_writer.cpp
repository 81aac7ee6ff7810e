#include "delim_scanner/artifact_writer.hpp"
#include "delim_scanner/mustache_renderer.hpp"
#include "delim_scanner/run_json.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace ds {

static std::string fmt2(double v) {
  std::ostringstream o;
  o.setf(std::ios::fixed);
  o.precision(2);
  o << v;
  return o.str();
}

static std::string printable_delimiter(const std::string& d) {
  if (d == "\t") return "\\t";
  return d;
}

static RenderContext report_context(const RunJsonPayload& p, const std::string& run_json) {
  RenderContext ctx;
  ctx.values = {
    {"filename",        p.filename},
    {"records",         std::to_string(p.records)},
    {"fields",          std::to_string(p.fields)},
    {"errors",          std::to_string(p.errors)},
    {"bytes",           std::to_string(p.bytes)},
    {"chunks",          std::to_string(p.chunks)},
    {"wall_time_ms",    fmt2(p.wall_time_ms)},
    {"throughput_mb_s", fmt2(p.throughput_mb_s)},
    {"complete",        p.complete ? "yes" : "no"},
    {"delimiter",       printable_delimiter(p.delimiter)},
    {"quote",           p.quote.empty() ? "(none)" : p.quote},
    {"quote_required",  p.quote_required ? "yes" : "no"},
    {"encoding",        p.encoding},
    {"run_json",        run_json},
  };

  std::vector<RenderContext::Row> header;
  for (std::size_t i = 0; i < p.header.size(); ++i)
    header.push_back({{"index", std::to_string(i)}, {"name", p.header[i]}});
  ctx.lists.emplace_back("header", std::move(header));

  std::vector<RenderContext::Row> errors;
  for (const auto& e : p.error_samples)
    errors.push_back({{"line", std::to_string(e.line)}, {"column", std::to_string(e.column)},
                      {"state", e.state}, {"input", e.input}});
  ctx.lists.emplace_back("error_samples", std::move(errors));

  std::vector<RenderContext::Row> states;
  for (const auto& kv : p.errors_by_state)
    states.push_back({{"state", kv.first}, {"count", std::to_string(kv.second)}});
  ctx.lists.emplace_back("errors_by_state", std::move(states));
  return ctx;
}

bool write_report_dir(const std::string& artifact_root,
                      const std::string& slug,
                      const RunJsonPayload& payload,
                      std::string* err_out) {
  const std::filesystem::path out_dir =
      std::filesystem::path(artifact_root) / slug;
  const std::string run_json = RunJsonWriter::to_json(payload);

  {
    std::error_code ec;
    std::filesystem::create_directories(out_dir, ec);
    std::ofstream rj(out_dir / "run.json", std::ios::binary);
    if (!rj) {
      if (err_out) *err_out = "failed to write run.json";
      return false;
    }
    rj.write(run_json.data(), static_cast<std::streamsize>(run_json.size()));
  }

  MustacheRenderer::Config rcfg;
#ifdef DS_DEFAULT_TEMPLATE_DIR
  rcfg.template_dir = DS_DEFAULT_TEMPLATE_DIR;
#else
  rcfg.template_dir = "templates";
#endif
  rcfg.partials_dir = rcfg.template_dir + "/partials";
  rcfg.assets       = {rcfg.template_dir + "/report.css"};

  MustacheRenderer renderer(rcfg);
  if (!renderer.render_page("report.mustache", report_context(payload, run_json),
                            out_dir.string(), "report.html")) {
    if (err_out) *err_out = renderer.last_error();
    return false;
  }
  if (!renderer.last_error().empty())
    std::cerr << "[report] " << renderer.last_error();
  return true;
}

}
