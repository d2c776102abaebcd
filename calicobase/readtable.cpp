// This file is part of Calico.
// See docs/License.html for the copyright notice.

#include "readtable.h"
#include "carule.h"    // for tokenize, trim, starts_with
#include "util.h"      // for linereader
#include <map>
#include <sstream>
#include <algorithm>
using namespace std ;

/*
 *   Lines come either from a file or from a built-in array.
 */
class tablesource {
public:
   virtual ~tablesource() {}
   virtual bool nextline(string &line) = 0 ;
} ;

class filesource : public tablesource {
public:
   filesource(gzFile f) : reader(f) {}
   virtual bool nextline(string &line) { return reader.getline(line) ; }
private:
   linereader reader ;
} ;

class arraysource : public tablesource {
public:
   arraysource(const char **l) : lines(l) {}
   virtual bool nextline(string &line) {
      if (*lines == 0)
         return false ;
      line = *lines++ ;
      return true ;
   }
private:
   const char **lines ;
} ;

static string errmsg ;

static const char *lineerror(const string &filename, int lineno,
                             const string &what) {
   ostringstream oss ;
   oss << "Error reading " << filename << " on line " << lineno << ": "
       << what ;
   errmsg = oss.str() ;
   return errmsg.c_str() ;
}

static const char *fileerror(const string &filename, const string &what) {
   errmsg = "Error reading " + filename + ": " + what ;
   return errmsg.c_str() ;
}

static bool parsestate(const string &tok, int n_states, state &s) {
   if (tok.empty() || tok.size() > 3)
      return false ;
   int v = 0 ;
   for (size_t i=0; i<tok.size(); i++) {
      if (tok[i] < '0' || tok[i] > '9')
         return false ;
      v = v * 10 + (tok[i] - '0') ;
   }
   if (v >= n_states)
      return false ;
   s = (state)v ;
   return true ;
}

static bool availablesymmetry(TNeighborhood kind, const string &name) {
   if (name == "none")
      return true ;
   if (kind == oneDimensional)
      return name == "reflect" ;
   return name == "reflect_horizontal" || name == "rotate4" ||
          name == "rotate4reflect" ;
}

/*
 *   Build the list of tuple permutations for the given symmetries.
 *   Each remap p satisfies permuted[j] = inputs[p[j]]; the identity is
 *   always first.  The transforms map the neighborhood onto itself, and
 *   together they form a group, so it does not matter whether we use a
 *   transform or its inverse.
 */
static void makeremaps(const nbshape &shape, const string &symmetries,
                       vector< vector<int> > &remaps) {
   int n = shape.size() ;
   int nrot = 1 ;
   bool reflect = false ;
   if (symmetries == "reflect" || symmetries == "reflect_horizontal")
      reflect = true ;
   else if (symmetries == "rotate4")
      nrot = 4 ;
   else if (symmetries == "rotate4reflect") {
      nrot = 4 ;
      reflect = true ;
   }
   remaps.clear() ;
   for (int flip=0; flip<(reflect ? 2 : 1); flip++)
      for (int rot=0; rot<nrot; rot++) {
         vector<int> p(n) ;
         for (int j=0; j<n; j++) {
            int x = shape.offsetx(j) ;
            int y = shape.offsety(j) ;
            if (flip)
               x = -x ;
            for (int i=0; i<rot; i++) {
               int t = x ;
               x = -y ;
               y = t ;
            }
            p[j] = shape.indexof(x, y) ;
         }
         remaps.push_back(p) ;
      }
}

/*
 *   Define every symmetric copy of one fully bound transition; tuples
 *   that already have an output keep it.
 */
static void definetransition(ruletable &t, const vector< vector<int> > &remaps,
                             const neighborhood &inputs, int output) {
   neighborhood permuted(inputs.size()) ;
   for (size_t i=0; i<remaps.size(); i++) {
      for (size_t j=0; j<inputs.size(); j++)
         permuted[j] = inputs[remaps[i][j]] ;
      if (t.lookup(permuted) < 0)
         t.define(permuted, output) ;
   }
}

static const char *loadtable(tablesource &src, const string &filename,
                             ruletable &table, TNeighborhood &kind, int &r) {
   const string n_states_keyword = "n_states:" ;
   const string neighborhood_keyword = "neighborhood:" ;
   const string radius_keyword = "radius:" ;
   const string symmetries_keyword = "symmetries:" ;
   const string variable_keyword = "var " ;

   int n_states = 0 ;
   TNeighborhood nbkind = oneDimensional ;
   int radius = 1 ;
   string symmetries = "none" ;
   bool n_states_parsed = false, neighborhood_parsed = false ;
   map< string, vector<state> > variables ;
   ruletable t ;
   bool tablemade = false ;
   vector< vector<int> > remaps ;
   int window = 0 ;

   string line ;
   int lineno = 0 ;
   while (src.nextline(line)) {
      lineno++ ;
      // snip off any trailing comment
      if (line.find('#') != string::npos)
         line.assign(line.begin(), line.begin() + line.find('#')) ;
      line = trim(line) ;
      if (line.empty())
         continue ;
      bool isheader = starts_with(line, n_states_keyword) ||
                      starts_with(line, neighborhood_keyword) ||
                      starts_with(line, radius_keyword) ||
                      starts_with(line, symmetries_keyword) ;
      if (isheader && tablemade)
         return lineerror(filename, lineno,
                          "header lines must come before the first transition") ;
      if (starts_with(line, n_states_keyword)) {
         if (sscanf(line.c_str() + n_states_keyword.length(), "%d",
                    &n_states) != 1)
            return lineerror(filename, lineno, line) ;
         if (n_states < 2 || n_states > MAXCELLSTATES)
            return lineerror(filename, lineno,
                             "n_states out of range (min 2, max 256)") ;
         n_states_parsed = true ;
      } else if (starts_with(line, neighborhood_keyword)) {
         string remaining = trim(line.substr(neighborhood_keyword.length())) ;
         if (parseneighborhood(remaining.c_str(), nbkind))
            return lineerror(filename, lineno, "unsupported neighborhood") ;
         neighborhood_parsed = true ;
      } else if (starts_with(line, radius_keyword)) {
         if (sscanf(line.c_str() + radius_keyword.length(), "%d", &radius) != 1
             || radius < 1)
            return lineerror(filename, lineno, "radius must be at least 1") ;
      } else if (starts_with(line, symmetries_keyword)) {
         if (!neighborhood_parsed)
            return fileerror(filename,
                             "neighborhood must be declared before symmetries") ;
         string remaining = trim(line.substr(symmetries_keyword.length())) ;
         if (!availablesymmetry(nbkind, remaining))
            return lineerror(filename, lineno, "unsupported symmetries") ;
         symmetries = remaining ;
      } else if (starts_with(line, variable_keyword)) {
         if (!n_states_parsed)
            return fileerror(filename, "n_states missing before first variable") ;
         vector<string> tokens = tokenize(line, "= {,}") ;
         if (tokens.size() < 3)
            return lineerror(filename, lineno, line) ;
         vector<state> states ;
         for (size_t i=2; i<tokens.size(); i++) {
            map< string, vector<state> >::const_iterator v =
               variables.find(tokens[i]) ;
            if (v != variables.end()) {
               // variables permitted inside later variables
               states.insert(states.end(), v->second.begin(), v->second.end()) ;
            } else {
               state s ;
               if (!parsestate(tokens[i], n_states, s))
                  return lineerror(filename, lineno,
                                   line + " - state value out of range") ;
               states.push_back(s) ;
            }
         }
         variables[tokens[1]] = states ;
      } else {
         // must be a transition line
         if (!n_states_parsed || !neighborhood_parsed)
            return fileerror(filename,
               "one or more of n_states or neighborhood missing before first transition") ;
         if (!tablemade) {
            window = windowsize(nbkind, radius) ;
            const char *err = ruletable::checksize(n_states, window) ;
            if (err)
               return fileerror(filename, err) ;
            t = ruletable(n_states, window) ;
            makeremaps(nbshape(nbkind, radius), symmetries, remaps) ;
            tablemade = true ;
         }
         vector<string> tokens ;
         if (n_states <= 10 && variables.empty() &&
             line.find(',') == string::npos) {
            // comma-free form: e.g. 0121 for 0,1,2 -> 1
            for (size_t i=0; i<line.size(); i++)
               if (line[i] != ' ' && line[i] != '\t')
                  tokens.push_back(string(1, line[i])) ;
         } else {
            tokens = tokenize(line, ", \t") ;
         }
         if ((int)tokens.size() != window + 1)
            return lineerror(filename, lineno, line + " - wrong number of entries") ;
         // collect the distinct variables; each is bound once per line
         vector<string> boundvars ;
         for (int i=0; i<window; i++)
            if (variables.find(tokens[i]) != variables.end() &&
                find(boundvars.begin(), boundvars.end(), tokens[i]) == boundvars.end())
               boundvars.push_back(tokens[i]) ;
         if (variables.find(tokens[window]) != variables.end() &&
             find(boundvars.begin(), boundvars.end(), tokens[window]) == boundvars.end())
            return lineerror(filename, lineno, line + " - output variable not bound") ;
         // plain states
         neighborhood fixed(window + 1) ;
         for (int i=0; i<=window; i++)
            if (variables.find(tokens[i]) == variables.end() &&
                !parsestate(tokens[i], n_states, fixed[i]))
               return lineerror(filename, lineno, line) ;
         // step through every binding of the variables, odometer style
         vector<size_t> pick(boundvars.size(), 0) ;
         for (size_t v=0; v<boundvars.size(); v++)
            if (variables[boundvars[v]].empty())
               return lineerror(filename, lineno, line + " - empty variable") ;
         neighborhood inputs(window) ;
         for (;;) {
            map<string, state> binding ;
            for (size_t v=0; v<boundvars.size(); v++)
               binding[boundvars[v]] = variables[boundvars[v]][pick[v]] ;
            for (int i=0; i<window; i++) {
               map<string, state>::const_iterator b = binding.find(tokens[i]) ;
               inputs[i] = (b != binding.end()) ? b->second : fixed[i] ;
            }
            map<string, state>::const_iterator b = binding.find(tokens[window]) ;
            int output = (b != binding.end()) ? b->second : fixed[window] ;
            definetransition(t, remaps, inputs, output) ;
            size_t v = 0 ;
            while (v < pick.size() &&
                   ++pick[v] == variables[boundvars[v]].size()) {
               pick[v] = 0 ;
               v++ ;
            }
            if (v == pick.size())
               break ;
         }
      }
   }
   if (!n_states_parsed || !neighborhood_parsed)
      return fileerror(filename, "one or more of n_states or neighborhood missing") ;
   if (!tablemade) {
      // no transitions; every tuple is undefined
      const char *err = ruletable::checksize(n_states, windowsize(nbkind, radius)) ;
      if (err)
         return fileerror(filename, err) ;
      t = ruletable(n_states, windowsize(nbkind, radius)) ;
   }
   table = t ;
   kind = nbkind ;
   r = radius ;
   return 0 ;
}

const char *readruletable(const char *filename, ruletable &table,
                          TNeighborhood &kind, int &r) {
   // gzopen reads uncompressed files as well
   gzFile in = gzopen(filename, "rb") ;
   if (in == 0) {
      errmsg = string("Failed to open file: ") + filename ;
      return errmsg.c_str() ;
   }
   filesource src(in) ;
   return loadtable(src, filename, table, kind, r) ;
}

const char *readruletabledata(const char **lines, ruletable &table,
                              TNeighborhood &kind, int &r) {
   arraysource src(lines) ;
   return loadtable(src, "built-in table", table, kind, r) ;
}
