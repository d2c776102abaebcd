// This file is part of Calico.
// See docs/License.html for the copyright notice.

/**
 *   Statistics over a finished history.  Each cell position is treated
 *   as a sequence of symbols over time; probabilities are the empirical
 *   frequencies along that sequence and logs are base 2, so results are
 *   in bits.  Zero-probability terms contribute nothing.
 */
#ifndef COMPLEXITY_H
#define COMPLEXITY_H
#include "cagrid.h"

// Shannon entropy of the states cell (x,y) takes over the history
const char *cellentropy(const cahistory &h, int x, int y, double &result) ;
// mean of cellentropy over all positions; within [0, log2(k)]
const char *averagecellentropy(const cahistory &h, double &result) ;
/*
 *   Mean over all positions of the mutual information between a cell's
 *   state at t and at t+temporaldistance, using every t for which both
 *   are in the history.  Never negative.
 */
const char *averagemutualinformation(const cahistory &h, double &result,
                                     int temporaldistance=1) ;
#endif
