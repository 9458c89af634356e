#include "taskrunner/executor/environment.hpp"

#include <algorithm>
#include <cstdlib>

#include "gtest/gtest.h"

using namespace taskrunner;

TEST(EnvironmentTest, InheritCopiesProcessEnvironment) {
  ::setenv("TASKRUNNER_ENV_TEST", "inherited", 1);

  auto env = Environment::inherit();

  EXPECT_EQ(env.get("TASKRUNNER_ENV_TEST"), "inherited");
  ::unsetenv("TASKRUNNER_ENV_TEST");
}

TEST(EnvironmentTest, OverlayReplacesAndAdds) {
  Environment env;
  env.set("PATH", "/bin");
  env.set("HOME", "/root");

  env.overlay({{"PATH", "/opt/bin:/bin"}, {"ROLE", "builder"}});

  EXPECT_EQ(env.get("PATH"), "/opt/bin:/bin");
  EXPECT_EQ(env.get("HOME"), "/root");
  EXPECT_EQ(env.get("ROLE"), "builder");
  EXPECT_EQ(env.size(), 3);
}

TEST(EnvironmentTest, MissingKey) {
  Environment env;
  EXPECT_FALSE(env.get("NOPE").has_value());
}

TEST(EnvironmentTest, ToStringsKeyEqualsValue) {
  Environment env;
  env.set("B", "2");
  env.set("A", "x=y");

  auto strings = env.to_strings();

  EXPECT_EQ(strings, (std::vector<std::string>{"A=x=y", "B=2"}));
}
