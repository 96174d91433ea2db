#ifndef OTOSUB_SINGER_HPP_
#define OTOSUB_SINGER_HPP_

#include <optional>
#include <string>

namespace otosub {

struct SampleMatch {
  std::string alias;
  std::optional<std::string> color;
};

// Read-only access to a singer's sample library
class Singer {
public:
  virtual ~Singer() = default;

  // Exact, case sensitive lookup of an alias at a pitch and voice color
  virtual std::optional<SampleMatch>
  tryGetMappedOto(const std::string &alias, int tone,
                  const std::string &color) const = 0;
};

} // namespace otosub

#endif // OTOSUB_SINGER_HPP_
