#include "mathutils.h"

bool is_zero(double x){
    return std::fabs(x) <= PRECISION;
}

unsigned long ceil_xdivy(unsigned long X, unsigned long Y){
    return (X + (Y - 1)) / Y;
}

static double entropy(double prob){
    if(is_zero(prob)) return 0.0;
    return prob * std::log2(1.0/prob);
}

static double normalize_entropy(double in, double total){
    return(entropy(in/total));
}

pattern_scratch_t::pattern_scratch_t(int wordlen)
    : mass_(get_num_patterns(wordlen), 0.0),
      used_(get_num_patterns(wordlen), false), total_(0.0) {}

void pattern_scratch_t::add(coloring_t pattern, double weight){
    if(!used_[pattern]){
        used_[pattern] = true;
        touched_.push_back(pattern);
    }
    mass_[pattern] += weight;
    total_ += weight;
}

double pattern_scratch_t::entropy() const {
    double out = 0.0;
    if(is_zero(total_)) return out;
    for(coloring_t p : touched_){
        out += normalize_entropy(mass_[p], total_);
    }
    return out;
}

void pattern_scratch_t::clear(){
    for(coloring_t p : touched_){
        mass_[p] = 0.0;
        used_[p] = false;
    }
    touched_.clear();
    total_ = 0.0;
}
