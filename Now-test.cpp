#include "Now.hpp"

#include <sstream>

int main(int argc, char* argv[])
{
  Now then;

  std::stringstream then_str;
  then_str << then;

  Now then_again{then};
  std::stringstream then_again_str;
  then_again_str << then_again;

  CHECK_EQ(then_str.str(), then_again_str.str());
  CHECK(then == then_again);

  // 2030-01-01T00:00:00Z
  Now const fixed{Now::time_point{std::chrono::seconds{1893456000}}};
  CHECK_EQ(fixed.sec(), 1893456000);
  CHECK_EQ(fixed.string(), "Tue, 01 Jan 2030 00:00:00 +0000");
  CHECK(fixed != then);
}
