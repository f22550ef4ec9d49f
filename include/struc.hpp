#ifndef STRUC_HPP
#define STRUC_HPP

#include <string>
#include <vector>
#include <set>
#include <cstdint>

#include <exception>
#include <stdexcept>

/*
structure:

selector: css token
  kind      class (.name) or id (#name)
  name      identifier, without prefix

identifier: js top-level name
  name
  form      function or variable, informational

change_record: one per rewritten file
  file            path
  type            "CSS" or "JavaScript"
  items           removed names, css ones with their prefix
  original_size   bytes before removal
  new_size        bytes after removal
  timestamp       iso-8601 local time

*/

#define FILETYPE_CSS "CSS"
#define FILETYPE_JS  "JavaScript"

// exceptions

class file_error : public std::exception
{
public:
  //! @brief Conctructor
  inline file_error(const std::string& what, const std::string& origin, std::string level="error")  { desc=what; filename=origin; severity=level; }
  //! @brief Error message
  inline const char * what () const throw () {return desc.c_str();}
  //! @brief Path of the file causing the exception
  inline const char * origin() const throw () {return filename.c_str();}
  //! @brief Severity of the exception
  inline const std::string level() const throw () {return severity.c_str();}
private:
  std::string desc;
  std::string filename;
  std::string severity;
};

// objects

class selector
{
public:
  enum _kind { css_class, css_id };

  selector() { kind=css_class; }
  selector(_kind k, std::string const& n) { kind=k; name=n; }

  _kind kind;
  std::string name;

  inline char prefix() const { return kind == css_id ? '#' : '.'; }
  // name with its prefix, as written in a stylesheet
  inline std::string str() const { return prefix() + name; }

  inline bool operator==(selector const& o) const { return kind == o.kind && name == o.name; }
  inline bool operator<(selector const& o) const { return kind != o.kind ? kind < o.kind : name < o.name; }
};

class identifier
{
public:
  enum _form { js_function, js_variable };

  identifier() { form=js_function; }
  identifier(std::string const& n, _form f=js_function) { name=n; form=f; }

  std::string name;
  _form form;

  inline std::string str() const { return name; }

  // form is informational: identity is the name
  inline bool operator==(identifier const& o) const { return name == o.name; }
  inline bool operator<(identifier const& o) const { return name < o.name; }
};

typedef std::set<selector> selector_set;
typedef std::set<identifier> identifier_set;

struct change_record {
  std::string file;
  std::string type;
  std::set<std::string> items;
  uint64_t original_size=0;
  uint64_t new_size=0;
  std::string timestamp;

  inline int64_t bytes_saved() const { return (int64_t) original_size - (int64_t) new_size; }
};

#endif //STRUC_HPP
