#include "generate_logic.h"

#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>

int execute_generate(const ulidkit::app::MintRequest& req, ulidkit::core::UlidGenerator& gen,
                     ulidkit::core::IClock& clock, bool as_json) {
  try {
    auto minted = ulidkit::app::mint_ids(req, gen, clock);
    if (!minted.has_value()) {
      std::cerr << "Error: " << minted.error() << "\n";
      return 1;
    }
    const auto& ids = minted.value();

    if (as_json) {
      nlohmann::json out;
      out["count"] = ids.size();
      out["ids"] = ids;
      std::cout << out.dump(2) << "\n";
      return 0;
    }

    for (const auto& id : ids) {
      std::cout << id << "\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: failed to generate ids: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
