/*
 *  date:   3 October 2026
 * */

namespace hypergraphify {

inline
VirtualDetectorAllocator::VirtualDetectorAllocator(uint64_t first)
    :first_id(first),
    next_id(first)
{}

inline VirtualDetectorAllocator
VirtualDetectorAllocator::for_model(const stim::DetectorErrorModel& dem) {
    uint64_t max_id;
    if (!get_max_detector_id(dem, max_id)) {
        return VirtualDetectorAllocator(0);
    }
    return VirtualDetectorAllocator(max_id+1);
}

inline uint64_t
VirtualDetectorAllocator::next() {
    return next_id++;
}

inline uint64_t
VirtualDetectorAllocator::peek() const {
    return next_id;
}

inline uint64_t
VirtualDetectorAllocator::get_first_id() const {
    return first_id;
}

inline size_t
VirtualDetectorAllocator::get_number_allocated() const {
    return static_cast<size_t>(next_id - first_id);
}

}   // hypergraphify
