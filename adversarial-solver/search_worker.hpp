#ifndef __SEARCH_WORKER_HPP___
#define __SEARCH_WORKER_HPP___

/**
 * @file search_worker.hpp
 * @brief Run an adversarial decision on a worker thread.
 */

#include <future>
#include <memory>
#include <utility>

#include "adversarial-solver.hpp"
#include "board.hpp"
#include "trace_buffer.hpp"

/**
 * @brief Start `choose_move` on its own thread.
 *
 * The board is shared read-only, the state is copied into the task. When
 * `stream` is given, every trace event is pushed into it while the search
 * runs and the buffer is closed when the search ends, normally or by an
 * exception. Exceptions reach the caller through the future.
 */
inline std::future<DecisionResult> launch_choose_move(std::shared_ptr<const Board> board, BoardState state,
                                                      Player player, SearchConfig config,
                                                      TraceBuffer<MovePath>* stream = nullptr) {
    return std::async(std::launch::async,
                      [board = std::move(board), state = std::move(state), player, config, stream]() {
                          struct CloseOnExit {
                              TraceBuffer<MovePath>* buffer;
                              ~CloseOnExit() {
                                  if (buffer) buffer->close();
                              }
                          } closer{stream};

                          if (!stream) return choose_move(*board, state, player, config);
                          BufferTraceSink<MovePath> sink(*stream);
                          return choose_move(*board, state, player, config, &sink);
                      });
}

#endif // __SEARCH_WORKER_HPP___
