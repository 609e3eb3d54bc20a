/* 
 *  date:   2 October 2026
 * */

#ifndef HYPERGRAPHIFY_DEFS_h
#define HYPERGRAPHIFY_DEFS_h

#include <stdint.h>

typedef double fp_t;

#endif  // HYPERGRAPHIFY_DEFS_h
