// This file is part of Calico.
// See docs/License.html for the copyright notice.

/**
 *   Rule table files.  A table file is plain text, optionally gzip
 *   compressed, and looks like this:
 *
 *      # comments run to the end of the line
 *      n_states:3
 *      neighborhood:oneDimensional      (or Moore, vonNeumann)
 *      radius:1                         (optional, default 1)
 *      symmetries:reflect               (optional, default none)
 *      var a={0,1,2}
 *      0,1,2,1
 *      a,0,a,2
 *      1022
 *
 *   Each transition lists the input tuple in neighborhood order followed
 *   by the output.  When n_states is at most 10 and no variables are
 *   declared the commas may be left out.  A variable stands for each of
 *   its states in turn; repeating a variable in one transition binds it
 *   to the same state everywhere, including the output.  If several
 *   transitions cover the same tuple the first one wins.
 *
 *   Available symmetries are "none" and "reflect" for oneDimensional and
 *   "none", "reflect_horizontal", "rotate4" and "rotate4reflect" for the
 *   two-dimensional neighborhoods.  A symmetric transition also defines
 *   every transformed copy of its tuple.
 */
#ifndef READTABLE_H
#define READTABLE_H
#include "ruletable.h"

// read a table file into table; returns err msg or 0
const char *readruletable(const char *filename, ruletable &table,
                          TNeighborhood &kind, int &r) ;
// same, but the lines come from a null-terminated array
const char *readruletabledata(const char **lines, ruletable &table,
                              TNeighborhood &kind, int &r) ;
#endif
