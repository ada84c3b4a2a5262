#include "cache_demo/nav_page.hpp"
#include "cache_demo/strategy.hpp"

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

namespace cd {

namespace {

std::string read_file(const std::string& path, std::string& err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) { err = "open failed: " + path; return {}; }
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

NavLink link_for(StrategyId id) {
  auto s = find_strategy(id);
  if (!s) return {};
  return NavLink{std::string(s->path), std::string(s->title), std::string(s->description)};
}

}

std::vector<NavSection> nav_sections() {
  return {
    {"Basic Cache Control", {link_for(StrategyId::MaxAge),
                             link_for(StrategyId::NoCache),
                             link_for(StrategyId::NoStore)}},
    {"Advanced Cache Control", {link_for(StrategyId::StaleWhileRevalidate),
                                link_for(StrategyId::StaleIfError)}},
    {"Conditional Requests", {link_for(StrategyId::ETagDemo),
                              link_for(StrategyId::LastModifiedDemo)}},
    {"Combined Strategies", {link_for(StrategyId::Combined)}},
    {"Utilities", {{"/update-data", "Update Server Data", "Increment counter to test cache invalidation"},
                   {"/force-error", "Force Server Error", "Simulate server error for SIE testing"}}},
  };
}

NavPageRenderer::NavPageRenderer() : cfg_{} {}

NavPageRenderer::NavPageRenderer(Config cfg) : cfg_(std::move(cfg)) {}

bool NavPageRenderer::render(std::string& out) {
  err_.clear();

  const auto tpl_path =
      (std::filesystem::path(cfg_.template_dir) / cfg_.template_name).string();
  std::string tpl = read_file(tpl_path, err_);
  if (tpl.empty()) {
    if (err_.empty()) err_ = "empty template: " + tpl_path;
    return false;
  }

  kainjow::mustache::mustache view(tpl);
  if (!view.is_valid()) { err_ = view.error_message(); return false; }

  kainjow::mustache::data sections{kainjow::mustache::data::type::list};
  for (auto& sec : nav_sections()) {
    kainjow::mustache::data links{kainjow::mustache::data::type::list};
    for (auto& l : sec.links) {
      kainjow::mustache::object link;
      link["href"] = l.href;
      link["title"] = l.title;
      link["description"] = l.description;
      links.push_back(kainjow::mustache::data{link});
    }
    kainjow::mustache::object s;
    s["heading"] = sec.heading;
    s["links"] = links;
    sections.push_back(kainjow::mustache::data{s});
  }

  kainjow::mustache::data ctx;
  ctx.set("title", cfg_.page_title);
  ctx.set("sections", sections);

  out = view.render(ctx);
  if (!view.is_valid()) { err_ = view.error_message(); return false; }
  return true;
}

}
