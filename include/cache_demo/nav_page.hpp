#pragma once
#include <string>
#include <vector>

namespace cd {

struct NavLink {
  std::string href;
  std::string title;
  std::string description;
};

struct NavSection {
  std::string heading;
  std::vector<NavLink> links;
};

// Headings and links of the "/" page, built from the strategy catalog plus
// the utility endpoints.
std::vector<NavSection> nav_sections();

// Renders the navigation page from `<template_dir>/index.mustache`.
class NavPageRenderer {
public:
  struct Config {
    std::string template_dir = "templates";
    std::string template_name = "index.mustache";
    std::string page_title = "Cache Control Demo";
  };

  NavPageRenderer();
  explicit NavPageRenderer(Config cfg);

  // On failure returns false and leaves the reason in error().
  bool render(std::string& out);

  const std::string& error() const { return err_; }

private:
  Config cfg_;
  std::string err_;
};

}
