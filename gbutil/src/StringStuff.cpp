#include "StringStuff.h"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <cstdlib>
#include <fstream>
#include <glob.h>

namespace stringstuff {
  std::istream& getlineNoComment(std::istream& is, string& s) {
    while (getline(is, s)) {
      size_t hash = s.find('#');
      if (hash!=string::npos) s.erase(hash);
      stripWhite(s);
      if (!s.empty()) break;
    }
    return is;
  }

  bool nocaseEqual(const string& s1, const string& s2) {
    return s1.size()==s2.size()
      && std::equal(s1.begin(), s1.end(), s2.begin(),
		    [](char a, char b) {return std::toupper(a)==std::toupper(b);});
  }

  void stripWhite(string& s) {
    size_t first = 0;
    while (first < s.size() && std::isspace(s[first])) first++;
    size_t last = s.size();
    while (last > first && std::isspace(s[last-1])) last--;
    s = s.substr(first, last-first);
  }

  std::list<string>
  split(const string& s, char c) {
    std::list<string> out;
    size_t subStart=0;
    size_t subEnd=0;
    while (subEnd < s.size()) {
      if (s[subEnd]==c || (c==0 && std::isspace(s[subEnd]))) {
	// Do not save a word on consecutive whitespace
	if (c!=0 || subEnd>subStart)
	  out.push_back(s.substr(subStart, subEnd-subStart));
	subStart = ++subEnd;
      } else {
	subEnd++;
      }
    }
    if (c==0 && subStart==s.size()) {
      // no trailing word after whitespace
    } else if (subStart < s.size()) {
      out.push_back(s.substr(subStart));
    } else {
      // Empty string after a trailing separator
      out.push_back("");
    }
    return out;
  }

  string taggedCommandLine(int argc, char *argv[]) {
    time_t now = time(0);
    char stamp[32];
    strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", gmtime(&now));
    std::ostringstream oss;
    oss << stamp << ":";
    for (int i=0; i<argc; i++) oss << " " << argv[i];
    return oss.str();
  }

  std::list<string>
  fileGlob(const string& patterns) {
    std::list<string> out;
    for (auto pattern : split(patterns,',')) {
      stripWhite(pattern);
      if (pattern.empty()) continue;
      glob_t gt;
      if (glob(pattern.c_str(), 0, NULL, &gt)==0) {
	for (size_t j=0; j<gt.gl_pathc; j++)
	  out.push_back(gt.gl_pathv[j]);
      } else {
	// Let the caller report the missing file by name
	out.push_back(pattern);
      }
      globfree(&gt);
    }
    return out;
  }

  string
  findFileOnPath(const string& filename, const string& environmentVar) {
    string base = filename;
    stripWhite(base);
    if (base.empty() || base[0]=='/') return base;

    const char* dirs = std::getenv(environmentVar.c_str());
    for (auto dir : split(dirs ? dirs : ".", ':')) {
      // An empty entry means the current directory, as in $PATH
      string candidate = (dir.empty() ? "." : dir) + "/" + base;
      if (std::ifstream(candidate.c_str()).good()) return candidate;
    }
    return "";
  }
} // namespace stringstuff
