#include <sisodb/util/fn.hpp>

#include <vector>


using namespace siso;


bool siso::like(const std::string &str, const std::string &pattern)
{
    const std::string s = to_lower(str);
    const std::string p = to_lower(pattern);

    /* prev[j] == true iff pattern[:i-1] matches str[:j], cur[j] likewise for pattern[:i] */
    std::vector<bool> prev(s.length() + 1, false), cur(s.length() + 1, false);
    prev[0] = true; // empty pattern matches empty string

    for (std::size_t i = 1; i <= p.length(); ++i) {
        const auto c = p[i - 1];
        /* pattern `X%` matches the empty string iff `X` matches the empty string */
        cur[0] = '%' == c and prev[0];
        for (std::size_t j = 1; j <= s.length(); ++j) {
            if ('%' == c) {
                /* pattern `X%` matches `c_0...c_n` iff `X%` matches `c_0...c_{n-1}` or `X` matches `c_0...c_n` */
                cur[j] = cur[j - 1] or prev[j];
            } else if ('_' == c or s[j - 1] == c) {
                /* pattern `X_` or `Xa` matches `c_0...c_{n-1}a` iff `X` matches `c_0...c_{n-1}` */
                cur[j] = prev[j - 1];
            } else {
                cur[j] = false;
            }
        }
        prev.swap(cur);
    }

    return prev[s.length()];
}
