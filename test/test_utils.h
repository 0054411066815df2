// Copyright (c) Facebook, Inc. and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.

#pragma once
#include <torch/torch.h>

#include <cmath>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace psn_test {

/*
 * @brief 单个测试用例的结果
 */
struct TestResult {
  std::string name;
  bool passed = false;
  std::string error_message;

  void print() const {
    std::cout << (passed ? "[PASS] " : "[FAIL] ") << name << std::endl;
    if (!passed && !error_message.empty()) {
      std::cout << "       " << error_message << std::endl;
    }
  }
};

/*
 * @brief 测试执行器
 *
 * 逐个运行测试用例, 用例中抛出的异常记为失败。summary()返回进程退出码。
 */
class TestRunner {
 public:
  explicit TestRunner(std::string suite) : suite_(std::move(suite)) {
    std::cout << "==== " << suite_ << " ====" << std::endl;
  }

  void run(const std::string &name, const std::function<void()> &fn) {
    TestResult result;
    result.name = name;
    try {
      fn();
      result.passed = true;
    } catch (const std::exception &e) {
      result.error_message = e.what();
    }
    result.print();
    results_.push_back(result);
  }

  int summary() const {
    size_t passed = 0;
    for (const TestResult &r : results_) {
      passed += r.passed ? 1 : 0;
    }
    std::cout << "---- " << suite_ << ": " << passed << "/" << results_.size()
              << " passed ----" << std::endl;
    return passed == results_.size() ? 0 : 1;
  }

 private:
  std::string suite_;
  std::vector<TestResult> results_;
};

inline void expect(bool condition, const std::string &message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

inline std::string shape_string(at::IntArrayRef sizes) {
  std::ostringstream os;
  os << sizes;
  return os.str();
}

inline void expect_shape(const at::Tensor &t, std::vector<int64_t> shape,
                         const std::string &what) {
  expect(t.defined(), what + " is undefined");
  expect(t.sizes() == at::IntArrayRef(shape),
         what + " has shape " + shape_string(t.sizes()) + ", expected " +
             shape_string(shape));
}

inline void expect_close(const at::Tensor &actual, const at::Tensor &expected,
                         const std::string &what, double atol = 1e-5) {
  expect(actual.sizes() == expected.sizes(),
         what + ": shape " + shape_string(actual.sizes()) + " vs " +
             shape_string(expected.sizes()));
  const double diff =
      (actual.to(torch::kDouble) - expected.to(torch::kDouble))
          .abs()
          .max()
          .item<double>();
  expect(diff <= atol, what + ": max abs diff " + std::to_string(diff));
}

inline void expect_equal(const at::Tensor &actual, const at::Tensor &expected,
                         const std::string &what) {
  expect(actual.sizes() == expected.sizes() && actual.equal(expected),
         what + ": tensors differ");
}

// 期望fn抛出c10::Error且错误信息包含needle
inline void expect_error(const std::function<void()> &fn,
                         const std::string &needle) {
  try {
    fn();
  } catch (const c10::Error &e) {
    const std::string message = e.what();
    expect(message.find(needle) != std::string::npos,
           "error message does not mention '" + needle + "': " + message);
    return;
  }
  throw std::runtime_error("expected an error mentioning '" + needle + "'");
}

// 单位球面上均匀分布的点 [B, m, 3]
inline at::Tensor sphere_points(int64_t batch, int64_t m) {
  at::Tensor p = torch::randn({batch, m, 3});
  return p / p.norm(2, {2}, /*keepdim=*/true);
}

}  // namespace psn_test
