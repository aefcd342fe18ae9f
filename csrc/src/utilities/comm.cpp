// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "comm.h"

#include <atomic>
#include <barrier>
#include <condition_variable>
#include <cstdio>
#include <cstring>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <variant>

#include <fmt/core.h>

#include "tensor.h"

struct Communicator::CommandBuffer
{
    struct Send {
        const std::byte* Tensor;
        std::size_t Bytes;
        int Target;
    };

    struct Recv {
        std::byte* Tensor;
        std::size_t Bytes;
        int Source;
    };

    std::vector<std::variant<Send, Recv>> Commands;
};

/**
 * @brief Construct a communicator for a given rank and world size.
 *
 * @param rank Rank of this communicator (0 to world-1).
 * @param world Total number of ranks.
 *
 * @throws std::invalid_argument If @p rank is not a valid rank of a @p world sized group.
 */
Communicator::Communicator(int rank, int world) :
    mRank(rank), mWorld(world), mCmdBuf(std::make_unique<CommandBuffer>())
{
    if (world <= 0 || rank < 0 || rank >= world) {
        throw std::invalid_argument(fmt::format("Invalid communicator rank {} for world size {}", rank, world));
    }
}

Communicator::~Communicator() = default;

/**
 * @brief Begin a transaction.
 *
 * @throws std::runtime_error If the internal command buffer is not empty.
 */
void Communicator::begin_transaction() {
    if (!mCmdBuf->Commands.empty()) {
        throw std::runtime_error("begin_transaction: Buffer not empty");
    }
}

/**
 * @brief Visitor that executes buffered communication commands by dispatching to Communicator methods.
 */
struct Communicator::CommandVisitor {
    Communicator* Comm;

    void operator()(CommandBuffer::Send& cmd) const {
        Comm->send(cmd.Tensor, cmd.Target, cmd.Bytes);
    }

    void operator()(CommandBuffer::Recv& cmd) const {
        Comm->recv(cmd.Tensor, cmd.Source, cmd.Bytes);
    }
};

/**
 * @brief Execute all scheduled commands of the current transaction and wait for them.
 *
 * The command buffer is emptied before any command runs, so a failed transaction
 * does not leave stale commands behind.
 *
 * @throws std::runtime_error Propagates errors from command execution or hooks.
 */
void Communicator::execute_transaction() {
    CommandBuffer batch;
    std::swap(batch.Commands, mCmdBuf->Commands);

    on_execute_transaction(batch);

    CommandVisitor visitor{this};
    for (auto& cmd: batch.Commands) {
        std::visit(visitor, cmd);
    }

    on_finish_transaction();
}

namespace {
void check_peer(int peer, int rank, int world, const char* op) {
    if (peer < 0 || peer >= world || peer == rank) {
        throw std::runtime_error(fmt::format("{}: invalid peer {} for rank {} of {}", op, peer, rank, world));
    }
}
} // namespace

/**
 * @brief Schedule a point-to-point send of @p tensor's bytes to @p peer.
 *
 * The tensor memory must stay valid until execute_transaction() returns.
 *
 * @throws std::runtime_error If @p tensor is null or @p peer is invalid.
 */
void Communicator::schedule_send(const Tensor& tensor, int peer) {
    if (tensor.Data == nullptr) {
        throw std::runtime_error("send: Source tensor is null");
    }
    check_peer(peer, mRank, mWorld, "send");

    mCmdBuf->Commands.emplace_back(CommandBuffer::Send{.Tensor = tensor.Data, .Bytes = tensor.bytes(), .Target = peer});
}

/**
 * @brief Schedule a point-to-point receive from @p peer into @p tensor.
 *
 * @throws std::runtime_error If @p tensor is null or @p peer is invalid.
 */
void Communicator::schedule_recv(Tensor& tensor, int peer) {
    if (tensor.Data == nullptr) {
        throw std::runtime_error("recv: Target tensor is null");
    }
    check_peer(peer, mRank, mWorld, "recv");

    mCmdBuf->Commands.emplace_back(CommandBuffer::Recv{.Tensor = tensor.Data, .Bytes = tensor.bytes(), .Source = peer});
}

// ============================================================================
// Threaded Communicator
// ============================================================================

/**
 * @brief Communicator for ranks that run as threads of one process.
 *
 * Sends are buffered: each send copies its bytes into a FIFO mailbox for the
 * (source, target) pair, so a send never waits for its receiver. Receives take
 * the oldest message from the mailbox of their peer, which pairs sends and
 * receives between two ranks in the order they were issued.
 */
class ThreadedCommunicatorImpl : public Communicator {
public:
    struct Mailbox {
        std::mutex Mutex;
        std::condition_variable Ready;
        std::deque<std::vector<std::byte>> Messages;
    };

    struct SharedState {
        std::unique_ptr<std::barrier<>> Barrier;
        std::vector<const std::byte*> Buffer;   // one pointer per thread
        std::unique_ptr<Mailbox[]> Mailboxes;   // indexed by source * World + target
        std::vector<std::exception_ptr> Exceptions;
        std::exception_ptr FirstException;
        std::mutex Mutex;
        std::atomic<bool> Aborted{false};
        int World = 0;
        CommunicatorOptions Options;

        Mailbox& mailbox(int source, int target) {
            return Mailboxes[source * World + target];
        }

        //! Wakes every rank blocked in a receive; those receives then fail.
        void abort() {
            Aborted = true;
            for (int i = 0; i < World * World; ++i) {
                {
                    std::lock_guard<std::mutex> lock(Mailboxes[i].Mutex);
                }
                Mailboxes[i].Ready.notify_all();
            }
        }
    };

    ThreadedCommunicatorImpl(int rank, int world, std::shared_ptr<SharedState> state);

    /**
     * @brief Drops out of the shared barrier on destruction.
     */
    ~ThreadedCommunicatorImpl() override;

    void barrier() override;

    void all_gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) override;

    void send(const std::byte* src, int peer, std::size_t size) override;
    void recv(std::byte* tgt, int peer, std::size_t size) override;

    void on_execute_transaction(const Communicator::CommandBuffer& cmd) override;
    void on_finish_transaction() override;

private:
    void throw_if_aborted() const;

    std::shared_ptr<SharedState> mShare;

    struct sRecvParams {
        std::byte* Data;
        std::size_t Size;
        int Peer;
    };
    std::vector<sRecvParams> mRecvParams;
};

ThreadedCommunicatorImpl::ThreadedCommunicatorImpl(int rank, int world, std::shared_ptr<SharedState> state)
    : Communicator(rank, world), mShare(std::move(state))
{
}

ThreadedCommunicatorImpl::~ThreadedCommunicatorImpl() {
    if(mShare && mShare->Barrier) {
        mShare->Barrier->arrive_and_drop();
    }
}

void ThreadedCommunicatorImpl::throw_if_aborted() const {
    if (mShare->Aborted) {
        throw std::runtime_error(fmt::format("Rank {}: communication aborted because another rank failed", rank()));
    }
}

void ThreadedCommunicatorImpl::barrier() {
    mShare->Barrier->arrive_and_wait();
    throw_if_aborted();
}

void ThreadedCommunicatorImpl::all_gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) {
    barrier();
    mShare->Buffer[rank()] = object;
    barrier();
    for (int i = 0; i < world_size(); ++i) {
        std::memcpy(recv + i * size, mShare->Buffer[i], size);
    }
    barrier();
    mShare->Buffer[rank()] = nullptr;
}

void ThreadedCommunicatorImpl::send(const std::byte* src, int peer, std::size_t size) {
    Mailbox& box = mShare->mailbox(rank(), peer);
    {
        std::lock_guard<std::mutex> lock(box.Mutex);
        box.Messages.emplace_back(src, src + size);
    }
    box.Ready.notify_all();
}

void ThreadedCommunicatorImpl::recv(std::byte* tgt, int peer, std::size_t size) {
    mRecvParams.emplace_back(sRecvParams{tgt, size, peer});
}

void ThreadedCommunicatorImpl::on_execute_transaction(const Communicator::CommandBuffer& cmd) {
    throw_if_aborted();
    mRecvParams.clear();
    mRecvParams.reserve(cmd.Commands.size());
}

void ThreadedCommunicatorImpl::on_finish_transaction() {
    const auto timeout = mShare->Options.RecvTimeout;
    for (const auto& recv_param : mRecvParams) {
        Mailbox& box = mShare->mailbox(recv_param.Peer, rank());
        std::unique_lock<std::mutex> lock(box.Mutex);
        auto ready = [&]() { return !box.Messages.empty() || mShare->Aborted.load(); };
        if (timeout.count() > 0) {
            if (!box.Ready.wait_for(lock, timeout, ready)) {
                throw std::runtime_error(fmt::format("Rank {}: recv from rank {} timed out after {} ms",
                                                     rank(), recv_param.Peer, timeout.count()));
            }
        } else {
            box.Ready.wait(lock, ready);
        }

        if (box.Messages.empty()) {
            throw std::runtime_error(fmt::format("Rank {}: recv from rank {} aborted because another rank failed",
                                                 rank(), recv_param.Peer));
        }

        std::vector<std::byte> message = std::move(box.Messages.front());
        box.Messages.pop_front();
        lock.unlock();

        if (message.size() != recv_param.Size) {
            throw std::runtime_error(fmt::format("Size mismatch in recv/send: rank {} expected {} bytes from rank {}, got {}",
                                                 rank(), recv_param.Size, recv_param.Peer, message.size()));
        }
        std::memcpy(recv_param.Data, message.data(), message.size());
    }
    mRecvParams.clear();
}

// ============================================================================
// Thread Pack for managing worker threads
// ============================================================================

class CommunicatorThreadsPack {
public:
    CommunicatorThreadsPack(std::vector<std::jthread> threads,
                            std::shared_ptr<ThreadedCommunicatorImpl::SharedState> state)
        : mThreads(std::move(threads)), mState(std::move(state)) {}

    ~CommunicatorThreadsPack() {
        for (auto& t : mThreads) {
            if (t.joinable()) {
                t.join();
            }
        }
    }

    void join() {
        for (auto& t : mThreads) {
            if (t.joinable()) {
                t.join();
            }
        }
        check_exceptions();
    }

private:
    //! Re-throws the exception of the rank that failed first; the other ranks
    //! usually only failed because it aborted the shared state.
    void check_exceptions() {
        std::lock_guard<std::mutex> lock(mState->Mutex);
        for (std::size_t t = 0; t < mThreads.size(); ++t) {
            if (mState->Exceptions[t] && mState->Exceptions[t] != mState->FirstException) {
                fprintf(stderr, "Thread %zu exited with uncaught exception\n", t);
            }
        }
        fflush(stderr);
        if (auto error = mState->FirstException; error) {
            mState->FirstException = nullptr;
            std::fill(mState->Exceptions.begin(), mState->Exceptions.end(), nullptr);
            std::rethrow_exception(error);
        }
    }

    std::vector<std::jthread> mThreads;
    std::shared_ptr<ThreadedCommunicatorImpl::SharedState> mState;
};

// ============================================================================
// Main Entry Points
// ============================================================================

namespace {

std::unique_ptr<CommunicatorThreadsPack>
launch_communicators(int nranks, const CommunicatorOptions& options,
                          std::function<void(Communicator& comm)> work) {
    if (nranks <= 0) {
        throw std::invalid_argument(fmt::format("Cannot launch {} ranks", nranks));
    }

    auto shared_state = std::make_shared<ThreadedCommunicatorImpl::SharedState>();
    shared_state->Barrier = std::make_unique<std::barrier<>>(nranks);
    shared_state->Buffer.resize(nranks);
    shared_state->Mailboxes = std::make_unique<ThreadedCommunicatorImpl::Mailbox[]>(static_cast<std::size_t>(nranks) * nranks);
    shared_state->Exceptions.resize(nranks);
    shared_state->World = nranks;
    shared_state->Options = options;

    // the threads share ownership of the work item with the pack
    auto shared_work = std::make_shared<std::function<void(Communicator& comm)>>(std::move(work));

    std::vector<std::jthread> threads;
    threads.reserve(nranks);

    for (int rank = 0; rank < nranks; ++rank) {
        threads.emplace_back([rank, nranks, shared_state, shared_work]() {
            try {
                ThreadedCommunicatorImpl comm(rank, nranks, shared_state);
                (*shared_work)(comm);
                shared_state->Barrier->arrive_and_wait();
            } catch (...) {
                {
                    std::lock_guard<std::mutex> lock(shared_state->Mutex);
                    shared_state->Exceptions[rank] = std::current_exception();
                    if (!shared_state->FirstException) {
                        shared_state->FirstException = shared_state->Exceptions[rank];
                    }
                }
                shared_state->abort();
            }
        });
    }

    return std::make_unique<CommunicatorThreadsPack>(std::move(threads), shared_state);
}

} // anonymous namespace

void Communicator::run_communicators(int nranks, const CommunicatorOptions& options,
                                     std::function<void(Communicator& comm)> work) {
    auto pack = launch_communicators(nranks, options, std::move(work));
    pack->join();
}

