// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DUALPIPE_SRC_UTILITIES_COMM_H
#define DUALPIPE_SRC_UTILITIES_COMM_H

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <type_traits>
#include <vector>

struct Tensor;

struct CommunicatorOptions {
    //! How long a receive may wait for its matching send. Zero waits forever.
    std::chrono::milliseconds RecvTimeout{0};
};

/**
 * @brief Point-to-point communicator between pipeline ranks.
 *
 * Communication is issued in transactions: begin_transaction(), any number of
 * schedule_send()/schedule_recv() calls, then execute_transaction(), which
 * issues all scheduled operations as one batch and returns once every one of
 * them has completed.
 */
class Communicator {
public:
    Communicator(int rank, int world);
    virtual ~Communicator();

    virtual void barrier() = 0;

    void begin_transaction();
    void schedule_send(const Tensor& tensor, int peer);
    void schedule_recv(Tensor& tensor, int peer);
    void execute_transaction();

    [[nodiscard]] int rank() const { return mRank; }
    [[nodiscard]] int world_size() const { return mWorld; }

    template<typename T>
    std::vector<T> host_all_gather(const T& object) {
        static_assert(std::is_trivially_copyable_v<T>, "Cannot communicate type with non-trivial copy operator");
        std::vector<T> result(world_size());
        all_gather_bytes_host(reinterpret_cast<std::byte*>(result.data()), reinterpret_cast<const std::byte*>(&object), sizeof(T));
        return result;
    }

    /**
     * @brief Run @p work on @p nranks in-process ranks, one thread each (blocking).
     *
     * Exceptions thrown by any rank are re-thrown here once all threads have exited.
     *
     * @param nranks Number of ranks to launch.
     * @param options Transport options shared by all ranks.
     * @param work Callable invoked once per rank with that rank's communicator.
     */
    static void run_communicators(int nranks, const CommunicatorOptions& options, std::function<void(Communicator& comm)> work);

protected:
    virtual void send(const std::byte* src, int peer, std::size_t size) = 0;
    virtual void recv(std::byte* tgt, int peer, std::size_t size) = 0;

    virtual void all_gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) = 0;

    struct CommandBuffer;
    virtual void on_execute_transaction(const CommandBuffer&) = 0;
    virtual void on_finish_transaction() = 0;
private:
    int mRank;
    int mWorld;

    struct CommandVisitor;
    std::unique_ptr<CommandBuffer> mCmdBuf;

    friend struct CommandVisitor;
};

#endif //DUALPIPE_SRC_UTILITIES_COMM_H
