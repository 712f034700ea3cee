#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/backend/content_facade.hpp"
#include "internal/util/time.hpp"

namespace vodbridge::diagnostics {

struct RailSnapshot {
  std::string identifier;
  double      elapsed_ms{0};
  bool        from_cache{false};
  std::size_t item_count{0};
};

struct HomeSnapshot {
  double                    home_ms{0};
  bool                      home_from_cache{false};
  double                    total_ms{0};
  std::vector<RailSnapshot> rails;
};

// The home-view pipeline: home rails, then the first page of every rail.
class HomeView {
 public:
  HomeView(std::shared_ptr<backend::ContentFacade> facade, std::uint32_t rail_limit, util::SteadyFn clock = util::SteadyNow);

  HomeSnapshot Build(bool force_refresh);

 private:
  std::shared_ptr<backend::ContentFacade> facade_;
  std::uint32_t                           rail_limit_;
  util::SteadyFn                          clock_;
};

} // namespace vodbridge::diagnostics
