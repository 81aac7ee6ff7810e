#include "delim_scanner/mustache_renderer.hpp"
#include "delim_scanner/path_utils.hpp"

#if __has_include(<kainjow/mustache.hpp>)
  #include <kainjow/mustache.hpp>
#elif __has_include(<mustache.hpp>)
  #include <mustache.hpp>
#else
  #error "kainjow/Mustache header not found"
#endif

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

namespace ds {

namespace fs = std::filesystem;
namespace km = kainjow::mustache;

MustacheRenderer::MustacheRenderer() : cfg_{} {}
MustacheRenderer::MustacheRenderer(Config cfg) : cfg_(std::move(cfg)) {}

static bool slurp(const fs::path& path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss; ss << in.rdbuf();
  out = ss.str();
  return true;
}

static km::data to_data(const RenderContext& ctx) {
  km::data root;
  for (const auto& kv : ctx.values) root.set(kv.first, kv.second);
  for (const auto& l : ctx.lists) {
    km::data list{km::data::type::list};
    for (const auto& row : l.second) {
      km::data item;
      for (const auto& kv : row) item.set(kv.first, kv.second);
      list.push_back(item);
    }
    root.set(l.first, list);
  }
  return root;
}

// Each partials/*.mustache file becomes a partial named after its stem.
static void add_partials(const fs::path& dir, km::data& root) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file() || entry.path().extension() != ".mustache") continue;
    std::string body;
    if (!slurp(entry.path(), body)) continue;
    root.set(entry.path().stem().string(), km::data(km::partial([body]{ return body; })));
  }
}

bool MustacheRenderer::render(const std::string& template_name, const RenderContext& ctx, std::string& out) {
  err_.clear();
  const fs::path tpl_path = fs::path(cfg_.template_dir) / template_name;
  std::string tpl;
  if (!slurp(tpl_path, tpl)) { err_ = "open failed: " + tpl_path.string(); return false; }

  km::mustache view(tpl);
  if (!view.is_valid()) { err_ = template_name + ": " + view.error_message(); return false; }

  km::data data = to_data(ctx);
  add_partials(cfg_.partials_dir, data);
  out = view.render(data);
  if (!view.is_valid()) { err_ = template_name + ": " + view.error_message(); return false; }
  return true;
}

bool MustacheRenderer::render_page(const std::string& template_name,
                                   const RenderContext& ctx,
                                   const std::string& out_dir,
                                   const std::string& out_name) {
  std::string html;
  if (!render(template_name, ctx, html)) return false;

  const fs::path out_path = fs::path(out_dir) / out_name;
  if (!ensure_parent_dirs(out_path)) { err_ = "cannot create " + out_dir; return false; }
  std::ofstream out(out_path, std::ios::binary);
  if (!out) { err_ = "write failed: " + out_path.string(); return false; }
  out.write(html.data(), static_cast<std::streamsize>(html.size()));
  if (!out) { err_ = "write failed: " + out_path.string(); return false; }

  for (const auto& a : cfg_.assets) {
    const fs::path src(a);
    std::error_code ec;
    fs::copy_file(src, fs::path(out_dir) / src.filename(), fs::copy_options::overwrite_existing, ec);
    if (ec) err_ += "asset " + src.string() + ": " + ec.message() + "\n";
  }
  return true;
}

}
