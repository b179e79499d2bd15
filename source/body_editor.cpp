// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <post_body/body_editor.h>
#include <post_body/body_diff.h>
#include <post_body/text_patch.h>

#include <lager/event_loop/manual.hpp>
#include <lager/store.hpp>

#include <algorithm>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace post_body {

namespace {

/// Returns model with its body replaced and its length recomputed
BodyModel with_body(BodyModel model, Node body)
{
    model.length = body.scalar_length();
    model.body = immer::box<Node>{std::move(body)};
    return model;
}

BodyModel append_node_checked(BodyModel model, Node node, std::string_view func)
{
    const std::size_t added = node.scalar_length();
    if (model.length + added > model.max_length) {
        detail::log_document_error(func, model.id,
            "node of length " + std::to_string(added) + " exceeds the remaining "
            + std::to_string(model.max_length - model.length) + " characters");
        return model;
    }
    Node body = model.body.get();
    body += std::move(node);
    return with_body(std::move(model), std::move(body));
}

} // namespace

// ============================================================
// Reducer
// ============================================================

BodyModel body_update(BodyModel model, BodyAction action)
{
    if (!model.open) {
        detail::log_document_error("body_update", model.id, "post is closed, edit ignored");
        return model;
    }

    return std::visit(
        [&model](auto&& act) -> BodyModel {
            using T = std::decay_t<decltype(act)>;

            if constexpr (std::is_same_v<T, actions::AppendText>) {
                std::u32string scalars = to_scalars(act.text);
                const std::size_t room = model.max_length - std::min(model.length, model.max_length);
                if (scalars.size() > room) {
                    detail::log_document_error("body_update", model.id,
                        "text clipped from " + std::to_string(scalars.size())
                        + " to " + std::to_string(room) + " characters");
                    scalars.resize(room);
                }
                if (scalars.empty()) {
                    return model;
                }
                Node body = model.body.get();
                body += std::string_view{from_scalars(scalars)};
                return with_body(std::move(model), std::move(body));
            }

            else if constexpr (std::is_same_v<T, actions::AppendChar>) {
                if (model.length >= model.max_length) {
                    detail::log_document_error("body_update", model.id, "body length limit reached");
                    return model;
                }
                Node body = model.body.get();
                body += act.value;
                return with_body(std::move(model), std::move(body));
            }

            else if constexpr (std::is_same_v<T, actions::AppendNode>) {
                return append_node_checked(std::move(model), std::move(act.node), "body_update");
            }

            else if constexpr (std::is_same_v<T, actions::Backspace>) {
                Node body = model.body.get();
                if (!body.remove_last()) {
                    return model;
                }
                return with_body(std::move(model), std::move(body));
            }

            else if constexpr (std::is_same_v<T, actions::ReplaceBody>) {
                const std::size_t length = act.body.scalar_length();
                if (length > model.max_length) {
                    detail::log_document_error("body_update", model.id,
                        "replacement of length " + std::to_string(length) + " exceeds the limit of "
                        + std::to_string(model.max_length) + " characters");
                    return model;
                }
                return with_body(std::move(model), std::move(act.body));
            }

            else if constexpr (std::is_same_v<T, actions::Close>) {
                model.open = false;
                return model;
            }

            return model;
        },
        std::move(action));
}

// Store type deduction helper
inline auto make_body_store_impl(BodyModel initial) {
    return lager::make_store<BodyAction>(std::move(initial), lager::with_manual_event_loop{},
                                         lager::with_reducer(body_update));
}

using BodyStoreType = decltype(make_body_store_impl(std::declval<BodyModel>()));

// ============================================================
// BodyEditor Implementation
// ============================================================

struct BodyEditor::Impl {
    std::unique_ptr<BodyStoreType> store;
    EditorEffects effects;
    Node published;  // Last body observers were sent
    std::size_t patch_count = 0;
    bool closed_notified = false;

    /// Diff the published body against the current one and emit the patch
    void publish() {
        const BodyModel& model = store->get();
        const Node& current = model.body.get();

        if (auto patch = diff(published, current)) {
            ++patch_count;
            if (effects.on_patch) {
                effects.on_patch(BodyPatch{model.id, std::move(*patch)});
            }
            published = current;
        }

        if (!model.open && !closed_notified) {
            closed_notified = true;
            if (effects.on_closed) {
                effects.on_closed(model.id);
            }
        }
    }
};

BodyEditor::BodyEditor(uint64_t id, EditorOptions options) : impl_(std::make_unique<Impl>())
{
    BodyModel initial;
    initial.id = id;
    initial.max_length = options.max_length;
    initial = with_body(std::move(initial), std::move(options.initial));

    impl_->published = initial.body.get();
    impl_->store = std::make_unique<BodyStoreType>(make_body_store_impl(std::move(initial)));
}

BodyEditor::~BodyEditor() = default;
BodyEditor::BodyEditor(BodyEditor&&) noexcept = default;
BodyEditor& BodyEditor::operator=(BodyEditor&&) noexcept = default;

void BodyEditor::dispatch(BodyAction action)
{
    impl_->store->dispatch(std::move(action));
    impl_->publish();
}

void BodyEditor::append_text(std::string text)
{
    dispatch(actions::AppendText{std::move(text)});
}

void BodyEditor::append_char(char32_t c)
{
    dispatch(actions::AppendChar{c});
}

void BodyEditor::append_node(Node node)
{
    dispatch(actions::AppendNode{std::move(node)});
}

void BodyEditor::backspace()
{
    dispatch(actions::Backspace{});
}

void BodyEditor::replace_body(Node body)
{
    dispatch(actions::ReplaceBody{std::move(body)});
}

void BodyEditor::close()
{
    dispatch(actions::Close{});
}

const BodyModel& BodyEditor::get_model() const
{
    return impl_->store->get();
}

const Node& BodyEditor::body() const
{
    return get_model().body.get();
}

uint64_t BodyEditor::id() const
{
    return get_model().id;
}

std::size_t BodyEditor::length() const
{
    return get_model().length;
}

bool BodyEditor::is_open() const
{
    return get_model().open;
}

Node BodyEditor::snapshot() const
{
    return body();
}

std::size_t BodyEditor::patch_count() const
{
    return impl_->patch_count;
}

void BodyEditor::set_effects(EditorEffects effects)
{
    impl_->effects = std::move(effects);
}

} // namespace post_body
