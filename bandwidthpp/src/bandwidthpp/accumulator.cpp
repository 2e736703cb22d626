#include <bandwidthpp/accumulator.hpp>

namespace leaf = boost::leaf;

namespace HumanBandwidth
{
    leaf::result<Bandwidth> accumulate(std::span<Token const> tokens)
    {
        const BitCount limit = Bandwidth::max().totalBits();

        BitCount total = 0;
        for (auto const& token : tokens)
        {
            // uint64 * 2^43 stays far below 2^128, so neither step can wrap.
            total += BitCount{token.magnitude} * token.unit->bitsPerSecond;
            if (total > limit)
                return leaf::new_error(ParseError::numberOverflow(token.offset));
        }
        return Bandwidth::fromBits(total);
    }
}
