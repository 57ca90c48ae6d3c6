#include "trainer.hpp"
#include "errors.hpp"
#include "metrics.hpp"
#include <cmath>
#include <sstream>

std::string to_string(TerminalReason reason) {
    switch (reason) {
        case TerminalReason::None: return "none";
        case TerminalReason::Converged: return "converged";
        case TerminalReason::EpochLimitReached: return "epoch limit reached";
        case TerminalReason::Stopped: return "stopped";
    }
    return "none";
}

StegoPass forward_pass(StegoNetworks& nets, const torch::Tensor& cover_bundle, const torch::Tensor& secret_bundle,
                       const LossComposer& composer) {
    StegoPass pass;
    pass.cover = cover_bundle;
    pass.container = nets.hiding->encode(cover_bundle, secret_bundle);

    auto copies = cover_bundle.size(0) / secret_bundle.size(0);
    pass.secret = copies > 1 ? secret_bundle.repeat({copies, 1, 1, 1}) : secret_bundle;

    pass.revealed = nets.revealing->decode(pass.container);
    pass.terms = composer.compose(pass.cover, pass.container, pass.secret, pass.revealed);
    return pass;
}

void BatchStats::accumulate(const BatchStats& other) {
    loss += other.loss;
    hiding += other.hiding;
    reveal += other.reveal;
    diff_h += other.diff_h;
    diff_r += other.diff_r;
}

BatchStats BatchStats::averaged(int count) const {
    if (count <= 0) return *this;
    return {loss / count, hiding / count, reveal / count, diff_h / count, diff_r / count};
}

static BatchStats stats_of(const StegoPass& pass) {
    BatchStats stats;
    stats.loss = pass.terms.total.item<double>();
    stats.hiding = pass.terms.hiding.item<double>();
    stats.reveal = pass.terms.reveal.item<double>();
    stats.diff_h = Metrics::average_pixel_discrepancy(pass.cover, pass.container);
    stats.diff_r = Metrics::average_pixel_discrepancy(pass.secret, pass.revealed);
    return stats;
}

Trainer::Trainer(const RunConfig& config, RunContext context, StegoNetworks nets, CheckpointStore& store)
    : config(config), context(std::move(context)), nets(std::move(nets)), store(store),
      composer(config) {
    this->config.validate();
    if (!this->context.logger) {
        throw ConfigurationError("trainer needs a logger in its run context");
    }
    if (!this->nets.hiding || !this->nets.revealing) {
        throw ConfigurationError("trainer needs both a hiding and a revealing network");
    }
    if (this->nets.hiding->scheme() != config.model.scheme) {
        throw ConfigurationError("model.scheme is " + to_string(config.model.scheme) +
                                 " but the hiding network implements " + to_string(this->nets.hiding->scheme()));
    }

    this->nets.to(this->context.device);
    optimizer = std::make_unique<torch::optim::Adam>(
        this->nets.parameters(),
        torch::optim::AdamOptions(config.training.learning_rate)
            .betas(std::make_tuple(config.training.adam_beta1, 0.999)));
}

double Trainer::learning_rate() const {
    return optimizer->param_groups().front().options().get_lr();
}

void Trainer::check_layout(const BatchLayout& layout, const std::string& name, bool check_batch_size) const {
    auto expected = BatchLayout::training(config);
    std::stringstream problem;
    if (check_batch_size && layout.batch_size != expected.batch_size) {
        problem << "batch size " << layout.batch_size << " != training.batch_size_secret " << expected.batch_size;
    } else if (layout.num_secret != expected.num_secret) {
        problem << "num_secret " << layout.num_secret << " != capacity.num_secret " << expected.num_secret;
    } else if (layout.num_cover != expected.num_cover) {
        problem << "num_cover " << layout.num_cover << " != capacity.num_cover " << expected.num_cover;
    } else if (layout.num_training != expected.num_training) {
        problem << "num_training " << layout.num_training << " != capacity.num_training " << expected.num_training;
    } else if (layout.channels_cover != expected.channels_cover) {
        problem << "cover channels " << layout.channels_cover << " != data.channels_cover " << expected.channels_cover;
    } else if (layout.channels_secret != expected.channels_secret) {
        problem << "secret channels " << layout.channels_secret << " != data.channels_secret " << expected.channels_secret;
    } else if (layout.image_size != expected.image_size) {
        problem << "image size " << layout.image_size << " != data.image_size " << expected.image_size;
    }

    if (!problem.str().empty()) {
        throw ConfigurationError(name + ": " + problem.str());
    }
}

int Trainer::load_or_init() {
    if (!config.training.resume) {
        context.logger->log_info("Initialised parameters with seed " + std::to_string(context.seed));
        return 1;
    }

    auto id = store.resolve(config.experiment_name(), CheckpointSelector::latest());
    store.load(id, *nets.hiding, *nets.revealing, optimizer.get(), context.device, &plateau);
    context.logger->log_info("Resumed from checkpoint " + id.str());
    return id.epoch + 1;
}

BatchStats Trainer::train_step(const StegoBatch& batch, int epoch, int batch_index) {
    auto cover = pack_bundle(batch.cover.to(context.device), config.capacity.num_cover);
    auto secret = pack_bundle(batch.secret.to(context.device), config.capacity.num_secret);

    optimizer->zero_grad();
    auto pass = forward_pass(nets, cover, secret, composer);

    double loss = pass.terms.total.item<double>();
    if (!std::isfinite(loss)) {
        throw NumericalDivergence(epoch, batch_index, "loss is " + std::to_string(loss));
    }

    pass.terms.total.backward();

    auto params = nets.parameters();
    if (config.training.gradient_clip > 0.0) {
        torch::nn::utils::clip_grad_norm_(params, config.training.gradient_clip);
    }
    for (const auto& p : params) {
        if (p.grad().defined() && !torch::isfinite(p.grad()).all().item<bool>()) {
            optimizer->zero_grad();
            throw NumericalDivergence(epoch, batch_index, "gradient is not finite");
        }
    }

    optimizer->step();

    torch::NoGradGuard no_grad;
    return stats_of(pass);
}

BatchStats Trainer::validate(BatchSource& source) {
    torch::NoGradGuard no_grad;
    nets.eval();

    BatchStats total;
    int batches = 0;
    source.reset(0);
    while (auto batch = source.next()) {
        validate_batch(*batch, source.layout(), batches + 1);
        auto cover = pack_bundle(batch->cover.to(context.device), config.capacity.num_cover);
        auto secret = pack_bundle(batch->secret.to(context.device), config.capacity.num_secret);
        total.accumulate(stats_of(forward_pass(nets, cover, secret, composer)));
        batches++;
    }

    nets.train();
    return total.averaged(batches);
}

void Trainer::update_learning_rate(double monitored_loss) {
    if (monitored_loss < plateau.best_loss) {
        plateau.best_loss = monitored_loss;
        plateau.bad_epochs = 0;
        return;
    }

    if (++plateau.bad_epochs > config.training.lr_patience) {
        double lr = learning_rate() * config.training.lr_decay_factor;
        for (auto& group : optimizer->param_groups()) {
            group.options().set_lr(lr);
        }
        plateau.bad_epochs = 0;
        context.logger->log_info("Reducing learning rate to " + std::to_string(lr));
    }
}

CheckpointId Trainer::checkpoint(int epoch) {
    return store.save(config.experiment_name(), epoch, *nets.hiding, *nets.revealing, optimizer.get(), config,
                      &plateau);
}

TrainingSummary Trainer::run(BatchSource& train, BatchSource* val) {
    TrainingSummary summary;
    state = TrainerState::Init;
    stop_requested = false;

    check_layout(train.layout(), "training source", true);
    if (val) check_layout(val->layout(), "validation source", false);

    state = TrainerState::LoadOrInitParameters;
    summary.first_epoch = load_or_init();

    state = TrainerState::EpochLoop;
    context.logger->log_info("Starting training of " + config.experiment_name() + " (" +
                             to_string(config.model.scheme) + ")");

    int last_saved = -1;
    try {
        for (int epoch = summary.first_epoch; epoch <= config.training.epochs; epoch++) {
            nets.train();
            train.reset(static_cast<uint64_t>(epoch));

            BatchStats running;
            int batches = 0;
            while (!stop_requested) {
                auto batch = train.next();
                if (!batch) break;

                validate_batch(*batch, train.layout(), batches + 1);
                running.accumulate(train_step(*batch, epoch, batches + 1));
                batches++;

                if (batches % config.training.log_frequency == 0) {
                    auto mean = running.averaged(batches);
                    context.logger->log_training(epoch, batches, static_cast<int>(train.batches_per_epoch()),
                                                 mean.loss, mean.hiding, mean.reveal);
                }
            }

            if (stop_requested) {
                summary.reason = TerminalReason::Stopped;
                if (batches == 0) break;
            }

            EpochSummary epoch_summary;
            epoch_summary.epoch = epoch;
            epoch_summary.batches = batches;
            epoch_summary.train = running.averaged(batches);
            const auto& t = epoch_summary.train;
            context.logger->log_epoch(epoch, t.loss, t.hiding, t.reveal, t.diff_h, t.diff_r);

            double monitored = epoch_summary.train.loss;
            if (val && summary.reason != TerminalReason::Stopped) {
                epoch_summary.validation = validate(*val);
                const auto& v = *epoch_summary.validation;
                context.logger->log_validation(epoch, v.loss, v.diff_h, v.diff_r);
                monitored = v.loss;
            }
            update_learning_rate(monitored);
            epoch_summary.learning_rate = learning_rate();

            summary.history.push_back(epoch_summary);
            summary.last_epoch = epoch;

            bool converged = config.training.target_loss > 0.0 && monitored <= config.training.target_loss;
            if (converged && summary.reason == TerminalReason::None) {
                summary.reason = TerminalReason::Converged;
            }

            if (epoch % config.training.checkpoint_every == 0 || epoch == config.training.epochs ||
                summary.reason != TerminalReason::None) {
                summary.last_checkpoint = checkpoint(epoch);
                last_saved = epoch;
            }

            if (summary.reason != TerminalReason::None) break;
        }
    } catch (const StegoError& e) {
        state = TrainerState::Terminal;
        context.logger->log_error(e.what());
        throw;
    }

    if (summary.reason == TerminalReason::None) {
        summary.reason = TerminalReason::EpochLimitReached;
    }
    if (summary.last_epoch > 0 && last_saved != summary.last_epoch) {
        summary.last_checkpoint = checkpoint(summary.last_epoch);
    }

    state = TrainerState::Terminal;
    context.logger->log_info("Training finished: " + to_string(summary.reason));
    return summary;
}
