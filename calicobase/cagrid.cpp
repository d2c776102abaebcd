// This file is part of Calico.
// See docs/License.html for the copyright notice.

#include "cagrid.h"
using namespace std ;

/*
 *   Validate the requested size and number of states.
 */
const char *checkgrid(int height, int width, int k) {
   if (height <= 0 || width <= 0)
      return "Grid size must be positive." ;
   if (k < 2 || k > MAXCELLSTATES)
      return "Number of cell states must be from 2 to 256." ;
   return 0 ;
}

cagrid::cagrid(int width, int k)
   : dims(1), rows(1), cols(width), numstates(k) {
   allocate() ;
}

cagrid::cagrid(int height, int width, int k)
   : dims(2), rows(height), cols(width), numstates(k) {
   allocate() ;
}

// a bad size or k leaves an empty grid that remembers why
void cagrid::allocate() {
   badgrid = checkgrid(rows, cols, numstates) ;
   if (badgrid) {
      rows = cols = 0 ;
      return ;
   }
   cellbuf.assign((size_t)rows * (size_t)cols, 0) ;
}

int cagrid::setcell(int x, int y, int newstate) {
   if (x < 0 || x >= cols || y < 0 || y >= rows)
      return -1 ;
   if (newstate < 0 || newstate >= numstates)
      return -1 ;
   cellbuf[y * cols + x] = (state)newstate ;
   return 0 ;
}

bool cagrid::sameshape(const cagrid &g) const {
   return dims == g.dims && rows == g.rows && cols == g.cols &&
          numstates == g.numstates ;
}

int cagrid::population() const {
   int r = 0 ;
   for (size_t i=0; i<cellbuf.size(); i++)
      if (cellbuf[i])
         r++ ;
   return r ;
}

int cagrid::operator==(const cagrid &g) const {
   return sameshape(g) && cellbuf == g.cellbuf ;
}

const char *cahistory::push(const cagrid &g) {
   if (g.check())
      return g.check() ;
   if (!grids.empty() && !grids[0].sameshape(g))
      return "Grid shape does not match the history." ;
   grids.push_back(g) ;
   return 0 ;
}

static const char *seedcenter(cahistory &h, cagrid &g, int k, int val) {
   if (val < 1 || val >= k)
      return "Center cell state must be a non-quiescent state." ;
   g.setcell(g.width() / 2, g.height() / 2, val) ;
   h.clear() ;
   return h.push(g) ;
}

const char *initsimple(cahistory &h, int width, int k, int val) {
   const char *err = checkgrid(1, width, k) ;
   if (err)
      return err ;
   cagrid g(width, k) ;
   return seedcenter(h, g, k, val) ;
}

const char *initsimple2d(cahistory &h, int height, int width, int k, int val) {
   const char *err = checkgrid(height, width, k) ;
   if (err)
      return err ;
   cagrid g(height, width, k) ;
   return seedcenter(h, g, k, val) ;
}

/*
 *   Randomize count cells centered in the row-major cell order.
 */
static const char *randomize(cahistory &h, cagrid &g, mt19937 &rng,
                             int k, int count) {
   int n = g.size() ;
   if (count < 0)
      count = n ;
   if (count > n)
      return "Number of randomized cells exceeds the grid size." ;
   uniform_int_distribution<int> d(0, k - 1) ;
   int start = (n - count) / 2 ;
   for (int i=start; i<start+count; i++)
      g.setcell(i % g.width(), i / g.width(), d(rng)) ;
   h.clear() ;
   return h.push(g) ;
}

const char *initrandom(cahistory &h, int width, mt19937 &rng, int k,
                       int count) {
   const char *err = checkgrid(1, width, k) ;
   if (err)
      return err ;
   cagrid g(width, k) ;
   return randomize(h, g, rng, k, count) ;
}

const char *initrandom2d(cahistory &h, int height, int width, mt19937 &rng,
                         int k, int count) {
   const char *err = checkgrid(height, width, k) ;
   if (err)
      return err ;
   cagrid g(height, width, k) ;
   return randomize(h, g, rng, k, count) ;
}

static const char *fillcells(cahistory &h, cagrid &g,
                             const vector<int> &cells) {
   if ((int)cells.size() != g.size())
      return "Number of cells does not match the grid size." ;
   for (int i=0; i<g.size(); i++)
      if (g.setcell(i % g.width(), i / g.width(), cells[i]) < 0)
         return "Cell state out of range." ;
   h.clear() ;
   return h.push(g) ;
}

const char *initfromcells(cahistory &h, int width, int k,
                          const vector<int> &cells) {
   const char *err = checkgrid(1, width, k) ;
   if (err)
      return err ;
   cagrid g(width, k) ;
   return fillcells(h, g, cells) ;
}

const char *initfromcells2d(cahistory &h, int height, int width, int k,
                            const vector<int> &cells) {
   const char *err = checkgrid(height, width, k) ;
   if (err)
      return err ;
   cagrid g(height, width, k) ;
   return fillcells(h, g, cells) ;
}
