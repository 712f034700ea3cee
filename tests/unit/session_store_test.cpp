#include "internal/platform/session_store.hpp"

#include <cassert>
#include <fstream>
#include <iostream>
#include <string>

#include "tests/support/fakes.hpp"

namespace {

using vodbridge::platform::FileSessionStore;

std::string WriteSession(const std::string& name, const std::string& body) {
  const auto path = vodbridge::testing::MakeTempDir("session_store") / (name + ".json");
  std::ofstream out(path);
  out << body;
  return path.string();
}

void TestPopulatedCookiesCountAsSession() {
  FileSessionStore store(WriteSession("populated", R"({"cookies": {"session-id": "abc"}, "region": "de"})"));
  assert(store.HasSession());
}

void TestEmptyOrMalformedDocumentsDoNot() {
  assert(!FileSessionStore(WriteSession("empty_cookies", R"({"cookies": {}})")).HasSession());
  assert(!FileSessionStore(WriteSession("no_cookies", R"({"region": "de"})")).HasSession());
  assert(!FileSessionStore(WriteSession("list", R"([1, 2])")).HasSession());
  assert(!FileSessionStore(WriteSession("garbage", "cookies=abc")).HasSession());
}

void TestMissingFileHasNoSession() {
  assert(!FileSessionStore("/nonexistent/session.json").HasSession());
  assert(!FileSessionStore("").HasSession());
}

} // namespace

int main() {
  TestPopulatedCookiesCountAsSession();
  TestEmptyOrMalformedDocumentsDoNot();
  TestMissingFileHasNoSession();

  std::cout << "vodbridge_unit_session_store: pass\n";
  return 0;
}
