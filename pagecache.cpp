#include "pagecache.h"
#include <QMutexLocker>
#include <QDebug>
#include <algorithm>

PageCache::PageCache(int capacity) : capacity_(std::max(capacity, 1)) {}

void PageCache::touch(Entry& e, const PageRequest& key) {
    byRecency_.remove(e.token);
    e.token = ++nextToken_;
    byRecency_.insert(e.token, key);
}

void PageCache::evictOverflow() {
    while (entries_.size() > capacity_ && !byRecency_.isEmpty()) {
        auto oldest = byRecency_.begin();
        entries_.remove(oldest.value());
        byRecency_.erase(oldest);
        ++stats_.evictions;
    }
}

bool PageCache::get(const PageRequest& r, PageResult& out) {
    QMutexLocker lk(&mutex_);
    auto it = entries_.find(r);
    if (it == entries_.end()) { ++stats_.misses; return false; }
    touch(it.value(), r);
    out = it->result;
    ++stats_.hits;
    return true;
}

void PageCache::put(const PageRequest& r, const PageResult& result) {
    QMutexLocker lk(&mutex_);
    auto it = entries_.find(r);
    if (it == entries_.end()) it = entries_.insert(r, Entry{});
    it->result = result;
    touch(it.value(), r);
    evictOverflow();
}

bool PageCache::contains(const PageRequest& r) const {
    QMutexLocker lk(&mutex_);
    return entries_.contains(r);
}

int PageCache::invalidateSource(const QString& sourceIdentity) {
    QMutexLocker lk(&mutex_);
    int removed = 0;
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (it.key().source == sourceIdentity) {
            byRecency_.remove(it->token);
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed)
        qDebug() << "[pagebrowser] cache: invalidadas" << removed << "páginas de" << sourceIdentity;
    return removed;
}

void PageCache::clear() {
    QMutexLocker lk(&mutex_);
    entries_.clear();
    byRecency_.clear();
}

void PageCache::setCapacity(int capacity) {
    QMutexLocker lk(&mutex_);
    capacity_ = std::max(capacity, 1);
    evictOverflow();
}

int PageCache::capacity() const {
    QMutexLocker lk(&mutex_);
    return capacity_;
}

int PageCache::size() const {
    QMutexLocker lk(&mutex_);
    return int(entries_.size());
}

PageCache::Stats PageCache::stats() const {
    QMutexLocker lk(&mutex_);
    return stats_;
}
