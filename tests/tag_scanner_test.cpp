#include <cassert>
#include <string>

#include "qsoflux/tag_scanner.hpp"

int main() {
  using namespace qsoflux;

  {
    auto h = ParseTagHeader(" call:5 ");
    assert(h.name == "CALL");
    assert(h.length && *h.length == 5);

    auto typed = ParseTagHeader("FREQ:6:N");
    assert(typed.name == "FREQ");
    assert(typed.length && *typed.length == 6);

    auto bare = ParseTagHeader("EOR");
    assert(bare.name == "EOR");
    assert(!bare.length);

    auto junk = ParseTagHeader("CALL:x5");
    assert(!junk.length);
  }

  {
    auto fields = ScanRecord("<call:5>K1ABC <BAND:3:S>20m\n<FREQ:6:N>14.250");
    assert(fields.size() == 3);
    assert(fields.at("CALL") == "K1ABC");
    assert(fields.at("BAND") == "20m");
    assert(fields.at("FREQ") == "14.250");
  }

  // A value may itself contain markup characters.
  {
    auto fields = ScanRecord("<COMMENT:9>a <b> c>d<CALL:4>W1AW");
    assert(fields.at("COMMENT") == "a <b> c>d");
    assert(fields.at("CALL") == "W1AW");
  }

  // Length running past the span skips the tag; scanning resumes after '>'.
  {
    auto tags = ScanTags("<NAME:50>Bob<CALL:4>W1AW");
    assert(tags.size() == 2);
    assert(tags[0].name == "NAME");
    assert(!tags[0].accepted);
    assert(tags[0].declared_length && *tags[0].declared_length == 50);
    assert(tags[1].accepted && tags[1].value == "W1AW");

    auto fields = ScanRecord("<NAME:50>Bob<CALL:4>W1AW");
    assert(fields.count("NAME") == 0);
    assert(fields.at("CALL") == "W1AW");
  }

  // Tags without a length are skipped.
  {
    auto fields = ScanRecord("<APP_X>junk<CALL:4>W1AW");
    assert(fields.size() == 1);
    assert(fields.at("CALL") == "W1AW");
  }

  // Last write wins.
  {
    auto fields = ScanRecord("<CALL:4>W1AW<CALL:5>K1ABC");
    assert(fields.at("CALL") == "K1ABC");
  }

  // Unterminated tag ends the scan.
  {
    auto fields = ScanRecord("<CALL:4>W1AW<BAND:3");
    assert(fields.size() == 1);
  }

  // Zero-length values are kept as empty strings.
  {
    auto fields = ScanRecord("<NAME:0><CALL:4>W1AW");
    assert(fields.at("NAME").empty());
    assert(fields.at("CALL") == "W1AW");
  }

  assert(ScanRecord("").empty());
  assert(ScanRecord("no tags here").empty());
  return 0;
}
