/*
 *  date:   3 October 2026
 * */

#ifndef HYPERGRAPHIFY_ALLOCATOR_h
#define HYPERGRAPHIFY_ALLOCATOR_h

#include "hypergraphify/ext/stim.h"

namespace hypergraphify {

// Hands out ids for virtual detectors. An allocator belongs to one
// transformation, and the ids it returns increase by one on every call.
class VirtualDetectorAllocator {
public:
    VirtualDetectorAllocator(uint64_t first_id=0);

    // The first id is one past the largest detector id in the model.
    static VirtualDetectorAllocator for_model(const stim::DetectorErrorModel&);

    uint64_t    next(void);
    uint64_t    peek(void) const;

    uint64_t    get_first_id(void) const;
    size_t      get_number_allocated(void) const;
private:
    uint64_t first_id;
    uint64_t next_id;
};

}   // hypergraphify

#include "allocator.inl"

#endif  // HYPERGRAPHIFY_ALLOCATOR_h
