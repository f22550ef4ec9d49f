#ifndef RECORD_HPP
#define RECORD_HPP

#include <string>
#include <vector>
#include <set>

#include "struc.hpp"

class change_recorder
{
public:
  // stamps the record with the current time
  change_record const& add(std::string const& file, std::string const& type, std::set<std::string> const& items, uint64_t original_size, uint64_t new_size);

  inline std::vector<change_record> const& records() const { return m_records; }
  inline size_t size() const { return m_records.size(); }
  inline bool empty() const { return m_records.empty(); }

  int64_t total_bytes_saved() const;

private:
  std::vector<change_record> m_records;
};

std::string gen_record(change_record const& rec);
std::string gen_report(change_recorder const& recorder, std::string const& generated);

#endif //RECORD_HPP
