#include <cassert>
#include <iostream>
#include <string>

#include "internal/observability/logging.hpp"

namespace {

using namespace streamledger::observability;

void TestPlainValuesStayBare() {
  assert(FormatFields({}).empty());
  assert(FormatFields({StringField("stream", "0xabc"), UIntField("amount", 20)}) == "stream=0xabc amount=20");
  assert(FormatFields({IntField("port", -1)}) == "port=-1");
}

void TestCallerTextCannotForgeFields() {
  assert(FormatFields({StringField("category", "music creator=0xevil")}) == R"(category="music creator=0xevil")");
  assert(FormatFields({StringField("error", "send tip: tips are disabled")}) == R"(error="send tip: tips are disabled")");
}

void TestQuotesAndControlCharactersAreEscaped() {
  assert(FormatFields({StringField("title", R"(say "hi")")}) == R"(title="say \"hi\"")");
  assert(FormatFields({StringField("path", R"(C:\db)")}) == R"(path="C:\\db")");
  assert(FormatFields({StringField("msg", "a\nb\tc")}) == R"(msg="a\nb\tc")");
  assert(FormatFields({StringField("manifest", "")}) == R"(manifest="")");
}

} // namespace

int main() {
  TestPlainValuesStayBare();
  TestCallerTextCannotForgeFields();
  TestQuotesAndControlCharactersAreEscaped();

  std::cout << "streamledger_unit_logging: pass\n";
  return 0;
}
