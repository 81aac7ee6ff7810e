#pragma once
#include <string>
#include <utility>
#include <vector>

namespace ds {

// Template data: scalar tags ({{name}}) and lists of rows ({{#name}}..{{/name}}).
struct RenderContext {
  using Row = std::vector<std::pair<std::string, std::string>>;
  Row values;
  std::vector<std::pair<std::string, std::vector<Row>>> lists;
};

// Renders templates from template_dir. Every *.mustache file in
// partials_dir is available as {{> <stem>}}.
class MustacheRenderer {
public:
  struct Config {
    std::string template_dir = "templates";
    std::string partials_dir = "templates/partials";
    std::vector<std::string> assets; // copied next to rendered pages
  };

  MustacheRenderer();
  explicit MustacheRenderer(Config cfg);

  bool render(const std::string& template_name, const RenderContext& ctx, std::string& out);

  // Renders into <out_dir>/<out_name> and copies the configured assets.
  // A missing asset is noted in last_error() but does not fail the page.
  bool render_page(const std::string& template_name,
                   const RenderContext& ctx,
                   const std::string& out_dir,
                   const std::string& out_name);

  const std::string& last_error() const noexcept { return err_; }

private:
  Config cfg_;
  std::string err_;
};

}
