/**
 * Header File for all math operations used in the wordle solver
 * #include "mathutils.h"
*/

#include <cmath>
#include <vector>
#include <cstdlib>
#include "word.h"

#ifndef MATH_H
#define MATH_H

#define PRECISION 1e-12

/**
 * Test if a floating point number is 0.
*/
bool is_zero(double x);

/**
 * Ceiling of x/y
*/
unsigned long ceil_xdivy(unsigned long X, unsigned long Y);

/**
 * Scatter reduce over the 3^L coloring buckets that only resets the
 * buckets it touched, so one scratch can be reused for every guess.
*/
class pattern_scratch_t {
public:
    explicit pattern_scratch_t(int wordlen = 0);

    /** Adds weight to the bucket of one coloring */
    void add(coloring_t pattern, double weight);
    /** Shannon entropy (bits) of the pooled weights, normalized by their sum */
    double entropy() const;
    /** Clears touched buckets */
    void clear();

private:
    std::vector<double> mass_;
    std::vector<bool> used_;
    std::vector<coloring_t> touched_;
    double total_;
};

#endif /* MATH_H */
