#include "record.hpp"

#include "util.hpp"

change_record const& change_recorder::add(std::string const& file, std::string const& type, std::set<std::string> const& items, uint64_t original_size, uint64_t new_size)
{
  change_record rec;
  rec.file = file;
  rec.type = type;
  rec.items = items;
  rec.original_size = original_size;
  rec.new_size = new_size;
  rec.timestamp = iso_timestamp();
  m_records.push_back(rec);
  return m_records.back();
}

int64_t change_recorder::total_bytes_saved() const
{
  int64_t ret=0;
  for(auto const& it: m_records)
    ret += it.bytes_saved();
  return ret;
}

std::string gen_record(change_record const& rec)
{
  std::string ret;
  ret += "File: " + rec.file + '\n';
  ret += "Type: " + rec.type + '\n';
  ret += "Timestamp: " + rec.timestamp + '\n';
  ret += strf("Original size: %lu bytes\n", rec.original_size);
  ret += strf("New size: %lu bytes\n", rec.new_size);
  ret += strf("Bytes saved: %ld\n", rec.bytes_saved());
  ret += "Removed items:\n";
  for(auto it: rec.items)
    ret += "  - " + it + '\n';
  ret += repeatString("-", 40) + "\n\n";
  return ret;
}

std::string gen_report(change_recorder const& recorder, std::string const& generated)
{
  std::string ret;
  ret += "UNUSED CODE REMOVAL LOG\n";
  ret += repeatString("=", 50) + '\n';
  ret += "Generated: " + generated + "\n\n";

  for(auto const& it: recorder.records())
    ret += gen_record(it);

  ret += "SUMMARY\n";
  ret += strf("Total files processed: %lu\n", recorder.size());
  ret += strf("Total bytes saved: %ld\n", recorder.total_bytes_saved());
  return ret;
}
