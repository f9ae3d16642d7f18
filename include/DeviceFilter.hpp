#ifndef REMAPEDIT_DEVICEFILTER_HPP
#define REMAPEDIT_DEVICEFILTER_HPP

#include <regex>
#include <string>

#include <Device.hpp>

namespace rme {

  class DeviceFilter {
  public:
    struct Criteria {
      Criteria();

      std::regex name;
      std::regex phys;
    };

    explicit DeviceFilter(Criteria criteria);

    bool operator()(const Device &device) const;

    // Regex matching exactly `text`.
    static std::string escape(const std::string &text);

  private:
    Criteria _criteria;
  };

}

#endif //REMAPEDIT_DEVICEFILTER_HPP
