#include <cassert>
#include <string>
#include <vector>

#include "qsoflux/chunk_splitter.hpp"

int main() {
  using namespace qsoflux;

  {
    const std::string doc = "header text <ADIF_VER:3>3.1 <EOH>\n<CALL:1>A<EOR>\n<CALL:1>B<EOR>\n";
    ChunkSplitter splitter(doc);
    assert(splitter.Header() == "header text <ADIF_VER:3>3.1 ");
    auto spans = splitter.Collect();
    assert(spans.size() == 2);
    assert(spans[0] == "\n<CALL:1>A");
    assert(spans[1] == "\n<CALL:1>B");
  }

  // No header: the whole document is the body.
  {
    const std::string doc = "<CALL:1>A<EOR><CALL:1>B<EOR>";
    ChunkSplitter splitter(doc);
    assert(splitter.Header().empty());
    assert(splitter.Collect().size() == 2);
  }

  // Blank spans are skipped; trailing text after the last marker is a span.
  {
    const std::string doc = "<EOH>\n<EOR>  \n <EOR><CALL:1>A<EOR>\n\t\n<CALL:1>Z";
    auto spans = ChunkSplitter(doc).Collect();
    assert(spans.size() == 2);
    assert(spans[0] == "<CALL:1>A");
    assert(spans[1] == "\n\t\n<CALL:1>Z");
  }

  // Markers are matched case-sensitively.
  {
    const std::string doc = "<eoh><CALL:1>A<eor><CALL:1>B<EOR>";
    ChunkSplitter splitter(doc);
    assert(splitter.Header().empty());
    auto spans = splitter.Collect();
    assert(spans.size() == 1);
    assert(spans[0] == "<eoh><CALL:1>A<eor><CALL:1>B");
  }

  // Iteration restarts from the first span.
  {
    const std::string doc = "<EOH><CALL:1>A<EOR><CALL:1>B<EOR><CALL:1>C<EOR>";
    ChunkSplitter splitter(doc);
    std::vector<std::string_view> first(splitter.begin(), splitter.end());
    std::vector<std::string_view> second;
    for (auto span : splitter) {
      second.push_back(span);
    }
    assert(first.size() == 3);
    assert(first == second);

    auto it = splitter.begin();
    auto prev = it++;
    assert(*prev == "<CALL:1>A");
    assert(*it == "<CALL:1>B");
  }

  assert(ChunkSplitter("").Collect().empty());
  assert(ChunkSplitter("<EOH>\n\n").Collect().empty());
  assert(IsBlank(" \r\n\t"));
  assert(!IsBlank(" x "));
  return 0;
}
