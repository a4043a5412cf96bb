/* SPDX-License-Identifier: GPL-3.0-only */
#include <algorithm>
#include <cstdlib>

#include <gtest/gtest.h>

#include "ptyspawn/system/Environment.hpp"
#include "ptyspawn/system/Platform.hpp"

/* NOLINTBEGIN(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */

using namespace ptyspawn::system;

using Env = std::vector<std::string>;

TEST(Environment, KeyOfEntry)
{
  EXPECT_EQ(environmentKey("PATH=/bin:/usr/bin"), "PATH");
  EXPECT_EQ(environmentKey("EMPTY="), "EMPTY");
  EXPECT_EQ(environmentKey("=C:=C:\\Windows"), "");
  EXPECT_EQ(environmentKey("NOEQUALS"), "");
}

TEST(Environment, LaterEntryWinsAtFirstPosition)
{
  Env In{"A=1", "B=2", "A=3", "C=4"};
  EXPECT_EQ(dedupEnvironment(In, false), (Env{"A=3", "B=2", "C=4"}));
}

TEST(Environment, CaseInsensitiveDedup)
{
  Env In{"A=1", "a=2", "B=3"};
  EXPECT_EQ(dedupEnvironment(In, true), (Env{"a=2", "B=3"}));
  EXPECT_EQ(dedupEnvironment(In, false), (Env{"A=1", "a=2", "B=3"}));
}

TEST(Environment, EntriesWithoutEqualsKeptVerbatim)
{
  Env In{"JUNK", "A=1", "JUNK", "A=2"};
  EXPECT_EQ(dedupEnvironment(In, true), (Env{"JUNK", "A=2", "JUNK"}));
}

TEST(Environment, MandatoryKeyAppendedOnlyIfMissing)
{
  std::string Value = getEnv("PATH");

  Env Missing = addMandatoryEnvironment(Env{"A=1"}, {"PATH"});
  EXPECT_EQ(Missing, (Env{"A=1", "PATH=" + Value}));

  Env Present = addMandatoryEnvironment(Env{"path=/nowhere"}, {"PATH"});
  EXPECT_EQ(Present, (Env{"path=/nowhere"}));
}

TEST(Environment, LookupDistinguishesUnsetFromEmpty)
{
  EXPECT_FALSE(
    lookupEnv("PTYSPAWN_TEST_SURELY_NOT_SET_VARIABLE_0123456789").has_value());
  EXPECT_EQ(getEnv("PTYSPAWN_TEST_SURELY_NOT_SET_VARIABLE_0123456789"), "");
}

TEST(Environment, ChildInheritsCurrentIfUnset)
{
  Env Current = currentEnvironment();
  Env Child = childEnvironment(std::nullopt, true);

  for (const std::string& E : Current)
    EXPECT_NE(std::find(Child.begin(), Child.end(), E), Child.end())
      << E << " not inherited";
}

TEST(Environment, ChildReceivesRequestedDeduplicated)
{
  Env Child = childEnvironment(Env{"X=1", "x=2", "Y=3"}, false);

  Env Expected{"x=2", "Y=3"};
  for (const std::string& Key : Platform::mandatoryEnvironment())
    Expected.push_back(Key + '=' + getEnv(Key));
  EXPECT_EQ(Child, Expected);
}

TEST(Environment, CaseSensitiveChildEnvironment)
{
  Env Child = childEnvironment(Env{"X=1", "x=2"}, true);
  ASSERT_GE(Child.size(), 2U);
  EXPECT_EQ(Child[0], "X=1");
  EXPECT_EQ(Child[1], "x=2");
}

/* NOLINTEND(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */
