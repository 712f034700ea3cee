#include "home_view.hpp"

#include <optional>

namespace vodbridge::diagnostics {

HomeView::HomeView(std::shared_ptr<backend::ContentFacade> facade, std::uint32_t rail_limit, util::SteadyFn clock)
    : facade_(std::move(facade)), rail_limit_(rail_limit), clock_(std::move(clock)) {
}

HomeSnapshot HomeView::Build(bool force_refresh) {
  HomeSnapshot snapshot;

  const auto start = clock_();
  auto       home  = facade_->GetHomeRails(force_refresh);
  const auto after_home = clock_();

  snapshot.home_ms         = util::ElapsedMs(start, after_home);
  snapshot.home_from_cache = home.from_cache;

  for (const auto& rail : home.value.rails()) {
    const auto rail_start = clock_();
    auto       page       = facade_->GetRail(rail.identifier(), std::nullopt, rail_limit_, force_refresh);

    RailSnapshot rs;
    rs.identifier = rail.identifier();
    rs.elapsed_ms = util::ElapsedMs(rail_start, clock_());
    rs.from_cache = page.from_cache;
    rs.item_count = static_cast<std::size_t>(page.value.items_size());
    snapshot.rails.push_back(std::move(rs));
  }

  snapshot.total_ms = util::ElapsedMs(start, clock_());
  return snapshot;
}

} // namespace vodbridge::diagnostics
