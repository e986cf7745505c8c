#include "internal/selection/golden_selector.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

#include "internal/model/source_identity.hpp"
#include "internal/util/errors.hpp"

namespace mc3d::selection {

GoldenSelector::GoldenSelector(std::vector<std::string> database_priority) : priority_(std::move(database_priority)) {
  if (priority_.empty()) {
    throw std::invalid_argument("database priority must not be empty");
  }
}

std::string GoldenSelector::Select(const model::Family& family) const {
  for (const auto& database : priority_) {
    for (const auto& source : family) {
      if (model::Parse(source).database == database) return source;
    }
  }

  throw util::ConsistencyFailure("no prioritised database in family starting with " +
                                 (family.empty() ? std::string("<empty>") : family.front()));
}

std::vector<std::string> GoldenSelector::Duplicates(const model::Family& family, const std::string& golden) {
  std::vector<std::string> out;
  std::copy_if(family.begin(), family.end(), std::back_inserter(out),
               [&](const std::string& source) { return source != golden; });
  return out;
}

} // namespace mc3d::selection
