/*
 *  date:   5 October 2026
 * */

namespace hypergraphify {

inline void
TransformationLog::append(log_entry_t e) {
    entries.push_back(std::move(e));
}

inline const std::vector<log_entry_t>&
TransformationLog::get_entries() const {
    return entries;
}

inline size_t
TransformationLog::size() const {
    return entries.size();
}

inline std::vector<log_entry_t>::const_iterator
TransformationLog::begin() const {
    return entries.cbegin();
}

inline std::vector<log_entry_t>::const_iterator
TransformationLog::end() const {
    return entries.cend();
}

}   // hypergraphify
