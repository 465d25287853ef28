#ifndef diff_hh_INCLUDED
#define diff_hh_INCLUDED

// Greedy forward variant of the algorithm described in
// "An O(ND) Difference Algorithm and Its Variations"
// (http://xmailserver.org/diff2.pdf), keeping the furthest reaching
// path of each step so that the edit script can be walked back.

#include "vector.hh"

#include <algorithm>
#include <functional>

namespace Bibsync
{

enum class DiffOp
{
    Keep,
    Add,
    Remove
};

// Calls on_diff(op, len) for each run of identical operations turning
// a[0..N) into b[0..M), using the fewest Add and Remove operations.
template<typename IteratorA, typename IteratorB, typename OnDiff, typename Equal = std::equal_to<>>
void for_each_diff(IteratorA a, int N, IteratorB b, int M, OnDiff&& on_diff, Equal eq = Equal{})
{
    const int max = N + M;
    // V[offset + k] is the furthest x reached on diagonal k = x - y
    const int offset = max + 1;
    Vector<int> V(2 * max + 3, 0);
    Vector<Vector<int>> trace;

    int D = 0;
    for (; D <= max; ++D)
    {
        trace.push_back(V);
        bool done = false;
        for (int k = -D; k <= D; k += 2)
        {
            const bool down = k == -D or (k != D and V[offset+k-1] < V[offset+k+1]);
            int x = down ? V[offset+k+1] : V[offset+k-1] + 1;
            int y = x - k;
            while (x < N and y < M and eq(a[x], b[y]))
                ++x, ++y;
            V[offset+k] = x;
            if (x >= N and y >= M)
            {
                done = true;
                break;
            }
        }
        if (done)
            break;
    }

    Vector<DiffOp> ops;
    for (int x = N, y = M; D >= 0; --D)
    {
        const auto& prev = trace[D];
        const int k = x - y;
        const bool down = k == -D or (k != D and prev[offset+k-1] < prev[offset+k+1]);
        const int prev_k = down ? k + 1 : k - 1;
        const int prev_x = D == 0 ? 0 : prev[offset+prev_k];
        const int prev_y = D == 0 ? 0 : prev_x - prev_k;

        while (x > prev_x and y > prev_y)
        {
            ops.push_back(DiffOp::Keep);
            --x, --y;
        }
        if (D > 0)
            ops.push_back(x == prev_x ? DiffOp::Add : DiffOp::Remove);
        x = prev_x;
        y = prev_y;
    }

    std::reverse(ops.begin(), ops.end());
    for (auto it = ops.begin(); it != ops.end(); )
    {
        auto run_end = std::find_if(it, ops.end(), [op = *it](DiffOp o) { return o != op; });
        on_diff(*it, (int)(run_end - it));
        it = run_end;
    }
}

}

#endif // diff_hh_INCLUDED
